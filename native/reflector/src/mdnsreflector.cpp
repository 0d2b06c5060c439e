#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <unistd.h> // fork, setsid, XX_FILENO

#include "Policy.hpp"
#include "Reflector.hpp"
#include "SystemEventQueue.hpp"
#include "util.hpp"

using namespace mdns_reflector;

namespace
{
  std::atomic<bool> running{false};

  // Restart backoff for the read loop supervisor.
  constexpr int BASE_BACKOFF_MS = 250;
  constexpr int MAX_BACKOFF_MS = 4000;

  void daemonize()
  {
    pid_t pid;

    // Fork off the parent process
    pid = fork();

    if (pid < 0)
    {
      exit(EXIT_FAILURE);
    }

    // If we got a good PID, exit the parent process
    if (pid > 0)
    {
      exit(EXIT_SUCCESS);
    }

    // Create a new SID for the child process
    if (setsid() < 0)
    {
      exit(EXIT_FAILURE);
    }

    close(STDIN_FILENO);
  }

  void signalHandler(int signal)
  {
    if (signal == SIGINT || signal == SIGTERM)
    {
      running = false;
    }
  }

  void usage()
  {
    std::cout << "Usage: mdns-reflector -config <policy.json> [-daemon] "
                 "[-restart <count>] [-u]"
              << std::endl;
  }

  void logPolicy(const Policy &policy)
  {
    std::stringstream ss;
    ss << "mDNS Reflector starting with " << policy.interfaces.size() << " interfaces";
    SystemEventQueue::push("main", ss.str());
    for (size_t i = 0; i < policy.rules.size(); ++i)
    {
      const auto &rule = policy.rules[i];
      std::stringstream rs;
      rs << "Rule " << i << ": From:" << rule.from << " To:" << formatList(rule.to)
         << " Types:" << formatList(rule.types) << " Filters:" << rule.filter.allowedIps.size()
         << " IPs";
      SystemEventQueue::push("main", rs.str());
    }
  }
} // namespace

int main(int argc, char *argv[])
{
  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  std::map<std::string, std::string> args;

  // Default values for optional parameters
  args["-config"] = "/etc/mdns-reflector/config.json";
  args["-daemon"] = "false";
  args["-restart"] = "0";
  args["-u"] = "false";

  // Parse command-line arguments
  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-config" || arg == "-restart") && i + 1 < argc)
    {
      args[arg] = argv[++i];
    }
    else if (arg == "-daemon" || arg == "-u")
    {
      args[arg] = "true";
    }
    else
    {
      std::cerr << "Unknown or incomplete option: " << arg << std::endl;
      usage();
      return EXIT_FAILURE;
    }
  }

  if (args["-u"] == "true")
  {
    usage();
    return EXIT_SUCCESS;
  }

  int maxRestarts = 0;
  try
  {
    maxRestarts = std::stoi(args["-restart"]);
  }
  catch (std::exception &)
  {
    std::cerr << "Invalid -restart value: " << args["-restart"] << std::endl;
    return EXIT_FAILURE;
  }

  Policy policy;
  auto error = loadPolicy(args["-config"], policy);
  if (!error.empty())
  {
    SystemEventQueue::error("policy", "Error loading config: " + error);
    return EXIT_FAILURE;
  }
  SystemEventQueue::setLevel(policy.logLevel);

  if (args["-daemon"] == "true")
  {
    SystemEventQueue::push("main", "Running in unattended mode.");
    daemonize();
  }

  logPolicy(policy);

  auto reflector = std::make_unique<Reflector>(policy);
  error = reflector->start();
  if (!error.empty())
  {
    SystemEventQueue::error("main", "Error starting reflector: " + error);
    return EXIT_FAILURE;
  }

  std::stringstream ss;
  ss << "mDNS Reflector started with " << policy.interfaces.size() << " interfaces";
  SystemEventQueue::push("main", ss.str());

  running = true;
  int restarts = 0;
  int exitCode = EXIT_SUCCESS;
  while (running)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto terminal = reflector->terminalError();
    if (terminal.empty())
      continue;

    if (restarts >= maxRestarts)
    {
      SystemEventQueue::error("main", "Read loop failed, exiting: " + terminal);
      exitCode = EXIT_FAILURE;
      break;
    }

    const int backoff = std::min(BASE_BACKOFF_MS << std::min(restarts, 8), MAX_BACKOFF_MS);
    restarts++;
    std::stringstream rs;
    rs << "Restarting reflector in " << backoff << "ms (" << restarts << "/" << maxRestarts << ")";
    SystemEventQueue::warn("main", rs.str());
    std::this_thread::sleep_for(std::chrono::milliseconds(backoff));

    reflector->stop();
    error = reflector->start();
    if (!error.empty())
    {
      SystemEventQueue::error("main", "Error restarting reflector: " + error);
      exitCode = EXIT_FAILURE;
      break;
    }
  }

  reflector->stop();
  SystemEventQueue::push("main", "Main thread exiting.");
  return exitCode;
}
