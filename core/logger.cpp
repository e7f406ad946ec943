/*
 * This file is part of SvgPdf.
 * Copyright (C) 2025 The SvgPdf Authors
 *
 * SvgPdf is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * SvgPdf is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with SvgPdf. If not, see <https://www.gnu.org/licenses/>.
 */
#include "logger.h"
#include <iostream>

Logger &Logger::Instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() { worker_ = std::thread(&Logger::Worker, this); }

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

const char *Logger::LevelTag(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "[debug] ";
  case LogLevel::Info:
    return "[info] ";
  case LogLevel::Warning:
    return "[warn] ";
  case LogLevel::Error:
  default:
    return "[error] ";
  }
}

void Logger::Log(LogLevel level, const std::string &msg) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level == LogLevel::Debug && !verbose_)
      return;
    queue_.push(std::string(LevelTag(level)) + msg);
  }
  cv_.notify_one();
}

bool Logger::SetLogFile(const std::string &path) {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this] { return queue_.empty() && !writing_; });
  if (file_.is_open())
    file_.close();
  if (path.empty())
    return true;
  file_.open(path, std::ios::out | std::ios::trunc);
  return file_.is_open();
}

void Logger::SetVerbose(bool verbose) {
  std::lock_guard<std::mutex> lock(mutex_);
  verbose_ = verbose;
}

void Logger::SetEchoToStderr(bool echo) {
  std::lock_guard<std::mutex> lock(mutex_);
  echo_ = echo;
}

void Logger::Flush() {
  std::unique_lock<std::mutex> lock(mutex_);
  drained_.wait(lock, [this] { return queue_.empty() && !writing_; });
}

void Logger::Worker() {
  std::unique_lock<std::mutex> lock(mutex_);
  while (true) {
    cv_.wait(lock, [this] { return done_ || !queue_.empty(); });
    if (done_ && queue_.empty())
      break;
    auto msg = queue_.front();
    queue_.pop();
    writing_ = true;
    const bool echo = echo_;
    lock.unlock();
    if (file_.is_open()) {
      file_ << msg << std::endl;
      file_.flush();
    }
    if (echo)
      std::cerr << msg << std::endl;
    lock.lock();
    writing_ = false;
    if (queue_.empty())
      drained_.notify_all();
  }
  drained_.notify_all();
}
