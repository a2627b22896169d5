#include "msg_channel.hpp"
#include <algorithm>

// How often a blocked sender re-checks its cancel token.
static constexpr std::chrono::milliseconds kCancelPoll{5};

MsgChannel::MsgChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool MsgChannel::try_send(Msg msg) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (q_.size() >= capacity_) return false;
    q_.push_back(std::move(msg));
  }
  readable_.notify_one();
  return true;
}

bool MsgChannel::send(Msg msg, const CancelToken& token, std::chrono::steady_clock::duration timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  {
    std::unique_lock<std::mutex> lk(mu_);
    while (q_.size() >= capacity_) {
      if (token.cancelled()) return false;
      auto now = std::chrono::steady_clock::now();
      if (now >= deadline) return false;
      auto slice = std::min<std::chrono::steady_clock::duration>(deadline - now, kCancelPoll);
      writable_.wait_for(lk, slice);
    }
    if (token.cancelled()) return false;
    q_.push_back(std::move(msg));
  }
  readable_.notify_one();
  return true;
}

std::optional<Msg> MsgChannel::try_recv() {
  std::optional<Msg> out;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (q_.empty()) return std::nullopt;
    out = std::move(q_.front());
    q_.pop_front();
  }
  writable_.notify_one();
  return out;
}

bool MsgChannel::wait(std::chrono::steady_clock::duration timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  bool ready = readable_.wait_for(lk, timeout, [this]{ return !q_.empty() || woken_; });
  woken_ = false;
  return ready;
}

void MsgChannel::wake() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    woken_ = true;
  }
  readable_.notify_all();
}

size_t MsgChannel::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return q_.size();
}
