#include "minitest.hpp"
#include "util/LatestWinsQueue.hpp"
#include <thread>

using Queue = ifwatch::util::LatestWinsQueue<int>;

TEST(queue_is_fifo_below_capacity) {
  Queue q(4);
  ASSERT_TRUE(q.push(1) == Queue::PushResult::Queued);
  ASSERT_TRUE(q.push(2) == Queue::PushResult::Queued);
  ASSERT_EQ(q.try_pop().value(), 1);
  ASSERT_EQ(q.try_pop().value(), 2);
  ASSERT_FALSE(q.try_pop().has_value());
  ASSERT_EQ(q.dropped(), 0u);
}

TEST(queue_drops_oldest_when_full) {
  Queue q(3);
  for (int i = 1; i <= 5; ++i) (void)q.push(i);
  ASSERT_EQ(q.size(), 3u);
  ASSERT_EQ(q.dropped(), 2u);
  ASSERT_EQ(q.try_pop().value(), 3);
  ASSERT_EQ(q.try_pop().value(), 4);
  ASSERT_EQ(q.try_pop().value(), 5);
}

TEST(queue_close_wakes_consumer_and_rejects_pushes) {
  Queue q(2);
  std::stop_source ss;
  bool got_nullopt = false;
  std::thread consumer([&]{ got_nullopt = !q.pop(ss.get_token()).has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  q.close();
  consumer.join();
  ASSERT_TRUE(got_nullopt);
  ASSERT_TRUE(q.push(7) == Queue::PushResult::Closed);
  ASSERT_TRUE(q.closed());
}

TEST(queue_pop_honours_stop_token) {
  Queue q(2);
  std::stop_source ss;
  bool got_nullopt = false;
  std::thread consumer([&]{ got_nullopt = !q.pop(ss.get_token()).has_value(); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  ss.request_stop();
  consumer.join();
  ASSERT_TRUE(got_nullopt);
}

TEST(queue_pop_receives_from_producer_thread) {
  Queue q(8);
  std::stop_source ss;
  std::thread producer([&]{ for (int i = 0; i < 5; ++i) (void)q.push(i); });
  int sum = 0;
  for (int i = 0; i < 5; ++i) sum += q.pop(ss.get_token()).value();
  producer.join();
  ASSERT_EQ(sum, 10);
}
