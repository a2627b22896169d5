#include "msg_channel.hpp"
#include "cancel_token.hpp"
#include <cassert>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

static void test_fifo_and_capacity() {
  MsgChannel ch(3);
  assert(ch.capacity() == 3);
  assert(ch.try_send(custom("a", 1)));
  assert(ch.try_send(custom("b", 2)));
  assert(ch.try_send(custom("c", 3)));
  assert(!ch.try_send(custom("d", 4)));
  assert(ch.size() == 3);
  auto m = ch.try_recv();
  assert(m && std::get<CustomMsg>(*m).tag == "a");
  assert(*std::get<CustomMsg>(*m).as<int>() == 1);
  assert(std::get<CustomMsg>(*ch.try_recv()).tag == "b");
  assert(std::get<CustomMsg>(*ch.try_recv()).tag == "c");
  assert(!ch.try_recv());
}

static void test_send_times_out_when_full() {
  MsgChannel ch(1);
  CancelToken tok;
  assert(ch.send(QuitMsg{}, tok, 10ms));
  auto t0 = std::chrono::steady_clock::now();
  assert(!ch.send(QuitMsg{}, tok, 30ms));
  assert(std::chrono::steady_clock::now() - t0 >= 30ms);
  assert(ch.size() == 1);
}

static void test_send_unblocks_on_cancel() {
  MsgChannel ch(1);
  CancelToken root;
  CancelToken tok = root.child();
  assert(ch.try_send(QuitMsg{}));
  std::thread canceller([&] {
    std::this_thread::sleep_for(20ms);
    root.cancel();
  });
  auto t0 = std::chrono::steady_clock::now();
  bool sent = ch.send(QuitMsg{}, tok, 5s);
  auto waited = std::chrono::steady_clock::now() - t0;
  canceller.join();
  assert(!sent);
  assert(waited < 2s);
  assert(tok.cancelled());
}

static void test_send_unblocks_when_drained() {
  MsgChannel ch(1);
  CancelToken tok;
  assert(ch.try_send(ErrorMsg{"first"}));
  std::thread reader([&] {
    std::this_thread::sleep_for(20ms);
    auto m = ch.try_recv();
    assert(m && std::get<ErrorMsg>(*m).what == "first");
  });
  assert(ch.send(ErrorMsg{"second"}, tok, 2s));
  reader.join();
  assert(std::get<ErrorMsg>(*ch.try_recv()).what == "second");
}

static void test_wait_and_wake() {
  MsgChannel ch(2);
  auto t0 = std::chrono::steady_clock::now();
  assert(!ch.wait(20ms));
  assert(std::chrono::steady_clock::now() - t0 >= 20ms);

  std::thread waker([&] {
    std::this_thread::sleep_for(10ms);
    ch.wake();
  });
  assert(ch.wait(5s));
  waker.join();

  assert(ch.try_send(QuitMsg{}));
  assert(ch.wait(0ms));
}

static void test_cancel_token_tree() {
  CancelToken root;
  CancelToken a = root.child();
  CancelToken b = a.child();
  assert(!b.cancelled());
  assert(!b.wait_for(5ms));
  a.cancel();
  assert(a.cancelled() && b.cancelled());
  assert(!root.cancelled());
  assert(b.wait_for(1h));
  a.cancel(); // idempotent
  root.cancel();
  CancelToken late = root.child();
  assert(late.cancelled());
}

int main() {
  test_fifo_and_capacity();
  test_send_times_out_when_full();
  test_send_unblocks_on_cancel();
  test_send_unblocks_when_drained();
  test_wait_and_wake();
  test_cancel_token_tree();
  return 0;
}
