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
#pragma once
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

enum class LogLevel { Debug = 0, Info, Warning, Error };

// Asynchronous logger writing level-tagged messages to stderr and,
// once SetLogFile() succeeds, to a log file.
class Logger {
public:
  // Access singleton instance, starting the writer thread on first use.
  static Logger &Instance();

  // Queue a message to be logged. Debug messages are dropped unless
  // verbose mode is enabled.
  void Log(LogLevel level, const std::string &msg);
  void Log(const std::string &msg) { Log(LogLevel::Info, msg); }
  void Debug(const std::string &msg) { Log(LogLevel::Debug, msg); }
  void Warn(const std::string &msg) { Log(LogLevel::Warning, msg); }
  void Error(const std::string &msg) { Log(LogLevel::Error, msg); }

  // Opens (truncating) the log file. An empty path closes the file sink.
  bool SetLogFile(const std::string &path);
  void SetVerbose(bool verbose);
  void SetEchoToStderr(bool echo);

  // Blocks until every queued message has been written.
  void Flush();

  static const char *LevelTag(LogLevel level);

private:
  Logger();
  ~Logger();
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  void Worker();

  std::ofstream file_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable drained_;
  std::queue<std::string> queue_;
  bool writing_ = false;
  bool verbose_ = false;
  bool echo_ = true;
  bool done_ = false;
  std::thread worker_;
};
