#include <iostream>
#include <string>
#include <vector>
#include <algorithm>
#include <cctype>
#include "CommandHandler.hpp"
#include "Pbkdf2Hash.hpp"
#include "Precision.hpp"

static void printUsage(const char* prog) {
  std::cerr << "usage: " << prog << " [--text <note>] [--batch] COMMAND [ARGS...]\n"
            << "  HASH <lat> <long> [prec...]\n"
            << "  COMPARE <hash> <lat> <long>\n"
            << "  GEOHASH <lat> <long> <bits>\n"
            << "  LOCATION <geohash>\n"
            << "  ERROR <bits> [<lat> <long>]\n"
            << "  BITS <prec>\n"
            << "  PREC <bits>\n"
            << "With --batch, commands are read one per line from stdin.\n";
}

int main(int argc, char **argv) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  std::string text;
  bool batch = false;
  std::vector<std::string> command;
  for(int i=1;i<argc;i++){
    std::string arg=argv[i];
    if (!command.empty()) {
      command.push_back(arg);
    } else if (arg=="--text" && i + 1 < argc) {
      text = argv[++i];
    } else if (arg=="--batch") {
      batch = true;
    } else if (arg=="--help" || arg=="-h") {
      printUsage(argv[0]);
      return 0;
    } else if (arg.rfind("--", 0) == 0) {
      std::cerr << "Unknown option " << arg << "\n";
      printUsage(argv[0]);
      return 2;
    } else {
      command.push_back(arg);
    }
  }

  if (text.size() > MAX_TEXT_LENGTH) {
    std::cerr << "--text must be at most " << MAX_TEXT_LENGTH << " bytes\n";
    return 2;
  }

  Pbkdf2Hash primitive;
  CommandHandler handler(std::cout, primitive, text);

  if (batch) {
    if (!command.empty()) {
      std::cerr << "--batch takes no command arguments\n";
      return 2;
    }
    bool ok = true;
    std::string line;
    while (std::getline(std::cin, line)) {
      if (std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c); })) continue;
      if (!handler.handleMessage(line)) ok = false;
    }
    return ok ? 0 : 1;
  }

  if (command.empty()) {
    printUsage(argv[0]);
    return 2;
  }

  std::string name = command[0];
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (!handler.isGeoCryptCommand(name)) {
    std::cerr << "Unknown command " << command[0] << "\n";
    printUsage(argv[0]);
    return 2;
  }

  std::vector<std::string> args(command.begin() + 1, command.end());
  return handler.handleCommand(name, args) ? 0 : 1;
}
