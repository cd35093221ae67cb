#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "bluelink/bluelink.hpp"
#include "bluelink/concurrency/io_context_manager.hpp"

using namespace bluelink;

// Two ends of a local socket pair stand in for an RFCOMM link: the "device" echoes
// every text line back as a record, the "host" prints what comes back.
int main(int argc, char** argv) {
  int count = (argc > 1) ? std::stoi(argv[1]) : 3;

  auto& logger = diagnostics::Logger::instance();
  logger.set_level(diagnostics::LogLevel::INFO);
  logger.set_format("{timestamp} [{level}] {component}: {message}");

  auto& ioc = concurrency::IoContextManager::instance().get_context();
  auto pair = transport::SocketChannel::make_local_pair(ioc, "00:1A:7D:DA:71:13", "F8:27:93:5C:10:01");

  auto host = multiplex(pair.first);
  auto device = multiplex(pair.second);

  auto echo = device->text_stream().subscribe(stream::make_observer<std::string>(
      [device](const std::string& line) {
        if (line.empty()) return;
        device->send(Record{"echo", std::vector<uint8_t>(line.begin(), line.end())});
      },
      [](const ErrorContext& e) { std::cerr << "[device] " << e.describe() << std::endl; }));

  std::atomic<int> received{0};
  auto replies = host->record_stream().subscribe(stream::make_observer<Record>(
      [&received](const Record& r) {
        std::cout << "[host] " << r.type << ": " << std::string(r.payload.begin(), r.payload.end()) << std::endl;
        received++;
      },
      [](const ErrorContext& e) { std::cout << "[host] channel ended: " << e.describe() << std::endl; }));

  for (int i = 0; i < count; ++i) {
    host->send(std::string_view("PING " + std::to_string(i) + "\n"));
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (received.load() < count && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  BLUELINK_LOG_INFO("example", "main", "Received " + std::to_string(received.load()) + " replies");
  device->close();
  host->close();
  echo.unsubscribe();
  replies.unsubscribe();
  concurrency::IoContextManager::instance().stop();
  return received.load() == count ? 0 : 1;
}
