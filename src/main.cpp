#include "task/task_macros.hpp"
#include "util/log.hpp"

#include <iostream>
#include <string>

int main(int argc, char** argv) {
  std::string command = argc > 1 ? argv[1] : "review";

  if (command != "review" && command != "init") {
    std::cerr << "usage: rev [review|init]" << std::endl;
    return 1;
  }

  if (!REV_INIT_TASK()) {
    std::cerr << "rev: initialization failed, see the log file for details" << std::endl;
    return 1;
  }

  if (command == "init") {
    rev::util::LogInfo("Main", "hello rev");
    return 0;
  }
  return REV_UI_TASK();
}
