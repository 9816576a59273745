// ANOD-Prod headers
#include "core/RingBuffer.hpp"
#include "core/Sample.hpp"
#include "core/SampleConsumer.hpp"
#include "core/SampleDistributor.hpp"

// GTest headers
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace anod::test {

  using core::RingBuffer;
  using core::Sample;
  using core::SampleConsumer;
  using core::SampleDistributor;

  namespace {
    Sample sampleNo(std::uint64_t n) {
      Sample s;
      s.sequence = n;
      s.timestamp = static_cast<double>(n + 1);
      s.target = 0.5 * static_cast<double>(n);
      return s;
    }
  } // namespace

  TEST(RingBuffer, drops_oldest_when_full) {
    RingBuffer<int> rb(3);
    EXPECT_TRUE(rb.push(1));
    EXPECT_TRUE(rb.push(2));
    EXPECT_TRUE(rb.push(3));
    EXPECT_FALSE(rb.push(4));
    EXPECT_EQ(1u, rb.dropped());
    EXPECT_EQ((std::vector<int>{ 2, 3, 4 }), rb.drain());
    EXPECT_FALSE(rb.tryPop());
  }

  TEST(RingBuffer, zero_capacity_is_rejected) {
    EXPECT_THROW(RingBuffer<int>(0), std::invalid_argument);
  }

  TEST(RingBuffer, close_wakes_a_waiting_consumer) {
    RingBuffer<int> rb(2);
    std::thread closer([&rb] {
      std::this_thread::sleep_for(std::chrono::milliseconds{ 20 });
      rb.close();
    });
    const auto begin = std::chrono::steady_clock::now();
    EXPECT_FALSE(rb.waitPop(std::chrono::seconds{ 5 }));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds{ 4 });
    closer.join();
    EXPECT_TRUE(rb.closed());

    rb.reopen();
    rb.push(7);
    EXPECT_EQ(7, rb.waitPop(std::chrono::milliseconds{ 10 }).value());
  }

  TEST(SampleDistributor, slow_consumer_keeps_the_newest_samples) {
    SampleDistributor dist;
    auto plot = dist.subscribe("plot", 2);
    for (std::uint64_t i = 0; i < 5; ++i)
      dist.publish(sampleNo(i));

    auto first = plot->poll();
    auto second = plot->poll();
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(3u, first->sequence);
    EXPECT_EQ(4u, second->sequence);
    EXPECT_FALSE(plot->poll());
    EXPECT_EQ(3u, plot->dropped());
    EXPECT_EQ(5u, dist.published());
  }

  TEST(SampleDistributor, every_queue_gets_every_sample_in_order) {
    SampleDistributor dist;
    auto plot = dist.subscribe("plot", 16);
    auto storage = dist.subscribe("storage", 16);
    for (std::uint64_t i = 0; i < 10; ++i)
      dist.publish(sampleNo(i));

    for (auto& q : { plot, storage }) {
      const auto all = q->drain();
      ASSERT_EQ(10u, all.size()) << q->name();
      for (std::size_t i = 0; i < all.size(); ++i)
        EXPECT_EQ(i, all[i].sequence);
    }
  }

  TEST(SampleDistributor, queues_drop_independently) {
    SampleDistributor dist;
    auto small = dist.subscribe("plot", 1);
    auto large = dist.subscribe("storage", 8);
    for (std::uint64_t i = 0; i < 4; ++i)
      dist.publish(sampleNo(i));
    EXPECT_EQ(1u, small->size());
    EXPECT_EQ(4u, large->size());
    EXPECT_EQ(0u, large->dropped());
  }

  TEST(SampleDistributor, subscriptions) {
    SampleDistributor dist;
    auto plot = dist.subscribe("plot", 4);
    EXPECT_THROW(dist.subscribe("plot", 4), std::invalid_argument);
    EXPECT_THROW(dist.subscribe("zero", 0), std::invalid_argument);
    EXPECT_EQ(1u, dist.subscribers());

    dist.unsubscribe("plot");
    EXPECT_EQ(0u, dist.subscribers());
    dist.publish(sampleNo(0));
    EXPECT_EQ(0u, plot->size()); // detached queue keeps its handle but gets nothing
  }

  TEST(SampleDistributor, publisher_never_blocks_on_a_stalled_consumer) {
    SampleDistributor dist;
    auto stalled = dist.subscribe("plot", 4);
    const auto begin = std::chrono::steady_clock::now();
    for (std::uint64_t i = 0; i < 10000; ++i)
      dist.publish(sampleNo(i));
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds{ 2 });
    EXPECT_EQ(4u, stalled->size());
  }

  TEST(SampleConsumer, delivers_in_order_and_drains_on_stop) {
    SampleDistributor dist;
    auto queue = dist.subscribe("storage", 64);

    std::mutex mtx;
    std::vector<std::uint64_t> seen;
    SampleConsumer consumer(queue, [&](const Sample& s) {
      std::lock_guard<std::mutex> lock(mtx);
      seen.push_back(s.sequence);
    });
    consumer.start();
    EXPECT_TRUE(consumer.running());
    for (std::uint64_t i = 0; i < 20; ++i)
      dist.publish(sampleNo(i));
    consumer.stop();

    EXPECT_FALSE(consumer.running());
    EXPECT_EQ(20u, consumer.consumed());
    ASSERT_EQ(20u, seen.size());
    for (std::size_t i = 0; i < seen.size(); ++i)
      EXPECT_EQ(i, seen[i]);
  }

  TEST(SampleConsumer, handler_failure_does_not_stop_delivery) {
    SampleDistributor dist;
    auto queue = dist.subscribe("plot", 8);
    std::atomic<int> calls{ 0 };
    SampleConsumer consumer(queue, [&](const Sample& s) {
      ++calls;
      if (s.sequence == 1)
        throw std::runtime_error("plot window closed");
    });
    consumer.start();
    for (std::uint64_t i = 0; i < 3; ++i)
      dist.publish(sampleNo(i));
    consumer.stop();

    EXPECT_EQ(3, calls.load());
    EXPECT_EQ(2u, consumer.consumed());
    EXPECT_EQ(1u, consumer.failures());
  }

  TEST(SampleConsumer, requires_queue_and_handler) {
    SampleDistributor dist;
    auto queue = dist.subscribe("plot", 8);
    EXPECT_THROW(SampleConsumer(nullptr, [](const Sample&) {}), std::invalid_argument);
    EXPECT_THROW(SampleConsumer(queue, SampleConsumer::Handler{}), std::invalid_argument);
  }

} // namespace anod::test
