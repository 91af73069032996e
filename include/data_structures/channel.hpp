#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

// Thread-safe queue shared between the batch dispatcher and its workers.
// Once closed, receivers drain what is left and then get std::nullopt.

template<typename T>
class Channel {
  public:
    // Returns false if the channel is already closed.
    bool send(const T& message);

    std::optional<T> receive();

    void close();
    bool isClosed();
    bool isEmpty();
    size_t size();

  private:
    std::deque<T> q_;
    bool closed_ = false;
    std::mutex messageMtx_;
    std::condition_variable messageCv_;
};


template<typename T>
bool Channel<T>::send(const T& message) {
  {
    std::lock_guard<std::mutex> lock(messageMtx_);
    if (closed_) return false;
    this->q_.emplace_back(message);
  }
  messageCv_.notify_one();
  return true;
}

template<typename T>
std::optional<T> Channel<T>::receive() {
  std::unique_lock<std::mutex> lock(messageMtx_);
  messageCv_.wait(lock, [this]() { return !q_.empty() || closed_; });
  if (q_.empty()) return std::nullopt;
  T message = q_.front();
  q_.pop_front();
  return message;
}

template<typename T>
void Channel<T>::close() {
  {
    std::lock_guard<std::mutex> lock(messageMtx_);
    closed_ = true;
  }
  messageCv_.notify_all();
}

template<typename T>
bool Channel<T>::isClosed() {
  std::lock_guard<std::mutex> lock(messageMtx_);
  return closed_;
}

template<typename T>
bool Channel<T>::isEmpty() {
  std::lock_guard<std::mutex> lock(messageMtx_);
  return q_.empty();
}

template<typename T>
size_t Channel<T>::size() {
  std::lock_guard<std::mutex> lock(messageMtx_);
  return q_.size();
}
