#include "cancel_token.hpp"
#include <algorithm>

CancelToken::CancelToken() : s_(std::make_shared<State>()) {}

void CancelToken::cancel_state(const std::shared_ptr<State>& s) {
  std::vector<std::weak_ptr<State>> kids;
  {
    std::lock_guard<std::mutex> lk(s->mu);
    if (s->cancelled) return;
    s->cancelled = true;
    kids.swap(s->children);
  }
  s->cv.notify_all();
  for (auto& w : kids) {
    if (auto k = w.lock()) cancel_state(k);
  }
}

void CancelToken::cancel() const { cancel_state(s_); }

bool CancelToken::cancelled() const {
  std::lock_guard<std::mutex> lk(s_->mu);
  return s_->cancelled;
}

bool CancelToken::wait_for(std::chrono::steady_clock::duration d) const {
  std::unique_lock<std::mutex> lk(s_->mu);
  return s_->cv.wait_for(lk, d, [this]{ return s_->cancelled; });
}

CancelToken CancelToken::child() const {
  auto kid = std::make_shared<State>();
  {
    std::lock_guard<std::mutex> lk(s_->mu);
    if (!s_->cancelled) {
      auto& v = s_->children;
      v.erase(std::remove_if(v.begin(), v.end(), [](const std::weak_ptr<State>& w){ return w.expired(); }), v.end());
      v.push_back(kid);
      return CancelToken(std::move(kid));
    }
  }
  kid->cancelled = true;
  return CancelToken(std::move(kid));
}
