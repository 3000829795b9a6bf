#include "logger.h"
#include <iostream>

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() {
  file_.open("partslabel.log", std::ios::out | std::ios::trunc);
  worker_ = std::thread(&Logger::Worker, this);
}

Logger::~Logger() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_ = true;
  }
  cv_.notify_one();
  if (worker_.joinable())
    worker_.join();
  if (file_.is_open())
    file_.close();
}

const char *Logger::LevelPrefix(LogLevel level) {
  switch (level) {
  case LogLevel::Warning:
    return "[warning] ";
  case LogLevel::Error:
    return "[error] ";
  case LogLevel::Info:
  default:
    return "[info] ";
  }
}

void Logger::Log(LogLevel level, const std::string &msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(LevelPrefix(level) + msg);
  }
  cv_.notify_one();
}

void Logger::SetEchoToStderr(bool echo) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = echo;
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    std::string text = std::move(queue_.front());
    queue_.pop();
    const bool echo = echo_;
    lock.unlock();
    if (file_.is_open()) {
      file_ << text << std::endl;
      file_.flush();
    }
    if (echo)
      std::cerr << text << std::endl;
    lock.lock();
  }
}
