#include "Fakes.hpp"
#include <FrameMailbox.hpp>
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <thread>

using Capture::FrameMailbox;
using Fakes::TestFrame;

TEST(FrameMailboxTest, EmptyUntilPublished) {
    FrameMailbox mailbox;
    EXPECT_FALSE(mailbox.hasPending());
    EXPECT_EQ(mailbox.takeLatest(), nullptr);
}

TEST(FrameMailboxTest, TakeConsumesTheFrame) {
    FrameMailbox mailbox;
    TestFrame frame(4, 2, 0x11);
    mailbox.publish(frame.view());

    EXPECT_TRUE(mailbox.hasPending());
    const IMGBuffer::Buffer* taken = mailbox.takeLatest();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(taken->width(), 4u);
    EXPECT_EQ(taken->height(), 2u);
    EXPECT_EQ(taken->sequence(), 1u);
    EXPECT_EQ(taken->data()[0], 0x11);

    EXPECT_FALSE(mailbox.hasPending());
    EXPECT_EQ(mailbox.takeLatest(), nullptr);
}

TEST(FrameMailboxTest, NewestFrameOverwritesUnconsumedOnes) {
    FrameMailbox mailbox;
    TestFrame a(4, 4, 0x01);
    TestFrame b(4, 4, 0x02);
    TestFrame c(4, 4, 0x03);
    mailbox.publish(a.view());
    mailbox.publish(b.view());
    mailbox.publish(c.view());

    EXPECT_EQ(mailbox.publishedCount(), 3u);
    EXPECT_EQ(mailbox.droppedCount(), 2u);

    const IMGBuffer::Buffer* taken = mailbox.takeLatest();
    ASSERT_NE(taken, nullptr);
    EXPECT_EQ(taken->sequence(), 3u);
    EXPECT_EQ(taken->data()[0], 0x03);
    EXPECT_EQ(mailbox.takenCount(), 1u);
}

TEST(FrameMailboxTest, TakenBufferSurvivesFurtherPublishes) {
    FrameMailbox mailbox;
    TestFrame a(2, 2, 0xaa);
    TestFrame b(2, 2, 0xbb);

    mailbox.publish(a.view());
    const IMGBuffer::Buffer* held = mailbox.takeLatest();
    ASSERT_NE(held, nullptr);

    mailbox.publish(b.view());
    mailbox.publish(b.view());
    EXPECT_EQ(held->data()[0], 0xaa);
    EXPECT_EQ(held->sequence(), 1u);
}

TEST(FrameMailboxTest, WakesOnEveryPublish) {
    FrameMailbox mailbox;
    int wakes = 0;
    mailbox.setWakeCallback([&wakes] { ++wakes; });

    TestFrame frame(2, 2);
    mailbox.publish(frame.view());
    mailbox.publish(frame.view());
    EXPECT_EQ(wakes, 2);
}

TEST(FrameMailboxTest, MalformedFrameIsRejected) {
    FrameMailbox mailbox;
    IMGBuffer::FrameView bad;
    bad.width = 4;
    bad.height = 4;
    bad.stride = 16;
    EXPECT_THROW(mailbox.publish(bad), std::invalid_argument);
    EXPECT_FALSE(mailbox.hasPending());
}

TEST(FrameMailboxTest, ConcurrentProducerNeverTearsOrReorders) {
    FrameMailbox mailbox;
    constexpr int kFrames = 2000;
    std::atomic<bool> done{false};

    std::thread producer([&] {
        for (int i = 0; i < kFrames; ++i) {
            // Sequence numbers start at 1; every byte carries the low byte of it
            TestFrame frame(32, 16, static_cast<std::uint8_t>((i + 1) & 0xff));
            mailbox.publish(frame.view());
        }
        done = true;
    });

    std::uint64_t last = 0;
    bool consistent = true;
    for (;;) {
        const bool finished = done.load();
        const IMGBuffer::Buffer* frame = mailbox.takeLatest();
        if (frame) {
            if (frame->sequence() <= last) {
                consistent = false;
            }
            last = frame->sequence();

            const std::uint8_t expected = static_cast<std::uint8_t>(frame->sequence() & 0xff);
            const std::uint8_t* begin = frame->data();
            const std::uint8_t* end = begin + frame->stride() * frame->height();
            if (std::any_of(begin, end, [expected](std::uint8_t b) { return b != expected; })) {
                consistent = false;
            }
        } else if (finished) {
            break;
        }
    }
    producer.join();

    EXPECT_TRUE(consistent);
    EXPECT_EQ(last, static_cast<std::uint64_t>(kFrames));
    EXPECT_EQ(mailbox.publishedCount(), static_cast<std::uint64_t>(kFrames));
    EXPECT_EQ(mailbox.takenCount() + mailbox.droppedCount(), mailbox.publishedCount());
}
