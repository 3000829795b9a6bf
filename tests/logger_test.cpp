#include "logger.h"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

int main() {
  Logger &logger = Logger::Instance();
  assert(&logger == &Logger::Instance());
  logger.SetEchoToStderr(false);

  assert(std::string(Logger::LevelPrefix(LogLevel::Info)) == "[info] ");
  assert(std::string(Logger::LevelPrefix(LogLevel::Warning)) == "[warning] ");
  assert(std::string(Logger::LevelPrefix(LogLevel::Error)) == "[error] ");

  // Several producers may queue messages at once.
  std::vector<std::thread> producers;
  for (int t = 0; t < 4; ++t)
    producers.emplace_back([&logger, t] {
      for (int i = 0; i < 50; ++i)
        logger.Info("producer " + std::to_string(t) + " message " +
                    std::to_string(i));
    });
  for (auto &producer : producers)
    producer.join();
  logger.Warning("done");
  return 0;
}
