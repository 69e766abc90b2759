#include "../lock/credential-buffer.h"

#include <gtest/gtest.h>

#include <utility>

using namespace shadelock;

namespace {

TEST(CredentialBufferTest, TypingEditingAndTaking)
{
    CredentialBuffer buffer;
    EXPECT_TRUE(buffer.isEmpty());

    EXPECT_TRUE(buffer.push("hunter"));
    EXPECT_TRUE(buffer.push("3"));
    EXPECT_TRUE(buffer.pop());
    EXPECT_TRUE(buffer.push("2"));
    EXPECT_EQ(buffer.size(), 7);

    EXPECT_EQ(buffer.take(), QByteArray("hunter2"));
    EXPECT_TRUE(buffer.isEmpty());
    EXPECT_TRUE(buffer.take().isEmpty());
    EXPECT_FALSE(buffer.pop());
}

TEST(CredentialBufferTest, NonPrintableInputIsSkipped)
{
    CredentialBuffer buffer;
    buffer.push(QString("a\tb") + QChar(0x1b) + QChar(0x7f));
    EXPECT_EQ(buffer.take(), QByteArray("ab"));
}

TEST(CredentialBufferTest, NonAsciiSurvivesAsUtf8)
{
    CredentialBuffer buffer;
    buffer.push(QString::fromUtf8("p\xc3\xa4ss"));
    EXPECT_EQ(buffer.take(), QByteArray("p\xc3\xa4ss"));
}

TEST(CredentialBufferTest, OverflowDropsInput)
{
    CredentialBuffer buffer;
    EXPECT_TRUE(buffer.push(QString(CredentialBuffer::Capacity, QChar('x'))));
    EXPECT_EQ(buffer.size(), CredentialBuffer::Capacity);
    EXPECT_FALSE(buffer.push("y"));
    EXPECT_EQ(buffer.size(), CredentialBuffer::Capacity);
    EXPECT_EQ(buffer.take(), QByteArray(CredentialBuffer::Capacity, 'x'));
}

TEST(CredentialBufferTest, ClearEmpties)
{
    CredentialBuffer buffer;
    buffer.push("secret");
    buffer.clear();
    EXPECT_TRUE(buffer.isEmpty());
    buffer.push("new");
    EXPECT_EQ(buffer.take(), QByteArray("new"));
}

TEST(CredentialBufferTest, TakenBytesHaveASingleOwner)
{
    CredentialBuffer buffer;
    buffer.push("hunter2");
    QByteArray taken = buffer.take();
    EXPECT_TRUE(taken.isDetached());

    QByteArray moved = std::move(taken);
    EXPECT_TRUE(moved.isDetached());
    wipeCredential(moved);
    EXPECT_TRUE(moved.isEmpty());
}

TEST(CredentialBufferTest, WipingACopyLeavesTheOtherOwner)
{
    QByteArray original("secret");
    QByteArray copy = original;
    wipeCredential(copy);
    EXPECT_TRUE(copy.isEmpty());
    EXPECT_EQ(original, QByteArray("secret"));
}

} // namespace
