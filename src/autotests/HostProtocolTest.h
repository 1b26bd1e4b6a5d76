/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef HOSTPROTOCOLTEST_H
#define HOSTPROTOCOLTEST_H

#include <QObject>

namespace Workdeck
{

class HostProtocolTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase();

    void testEncodeRequest();
    void testDecodeSuccessReply();
    void testDecodeErrorReply();
    void testDecodeErrorReplyWithoutText();
    void testDecodeEvent();
    void testDecodeRequest();
    void testDecodeInvalid();
    void testDecodeInvalid_data();
    void testBytesAreBase64();
    void testTerminalSpecOmitsEmptyFields();
    void testTerminalDescriptorFromJson();
};

}

#endif // HOSTPROTOCOLTEST_H
