#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager: `--key value`, `-alias value`, bare
// `--flag` for bool settings, and plain words filling `positional_keys`
// in order.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name,
                    std::string summary,
                    std::vector<std::string> positional_keys = {});

  // Returns false and fills `error` on the first bad argument.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;
  void usage(const SettingsManager& settings) const;

private:
  static bool looks_like_option(const std::string& arg);

  std::string process_name_;
  std::string summary_;
  std::vector<std::string> positional_keys_;
};
