#pragma once
#include <string>
#include <vector>

// Captured `iftop -t -P -N` text used across tests.
namespace fixtures {

inline std::vector<std::string> banner() {
  return {
    "interface: eth0",
    "IP address is: 192.168.1.10",
    "MAC address is: 52:54:00:12:34:56",
    "Listening on eth0",
    "   # Host name (port/service if enabled)            last 2s   last 10s   last 40s cumulative",
  };
}

inline std::vector<std::string> two_connection_block() {
  return {
    "--------------------------------------------------------------------------------------------",
    "   1 192.168.1.10:22                          =>     2.50Kb     2.00Kb     2.00Kb     5.00KB",
    "     192.168.1.20:51234                       <=     1.00Kb      800b       800b     2.00KB",
    "   2 192.168.1.10:443                         =>      800b       400b       400b     1.00KB",
    "     93.184.216.34:443                        <=     4.00Mb     2.00Mb     1.00Mb     3.00MB",
    "--------------------------------------------------------------------------------------------",
    "Total send rate:                                     3.30Kb     2.40Kb     2.40Kb",
    "Total receive rate:                                  4.00Mb     2.00Mb     1.00Mb",
    "Total send and receive rate:                         4.00Mb     2.00Mb     1.00Mb",
    "--------------------------------------------------------------------------------------------",
    "Peak rate (sent/received/total):                     3.30Kb     4.00Mb     4.00Mb",
    "Cumulative (sent/received/total):                    6.00KB     3.00MB     3.01MB",
    "============================================================================================",
  };
}

inline std::vector<std::string> empty_block() {
  return {
    "--------------------------------------------------------------------------------------------",
    "--------------------------------------------------------------------------------------------",
    "Total send rate:                                         0b         0b         0b",
    "Total receive rate:                                      0b         0b         0b",
    "Total send and receive rate:                             0b         0b         0b",
    "--------------------------------------------------------------------------------------------",
    "Peak rate (sent/received/total):                         0b         0b         0b",
    "Cumulative (sent/received/total):                        0B         0B         0B",
    "============================================================================================",
  };
}

// Joined with newlines, suitable for a shell printf
inline std::string text(const std::vector<std::string>& lines) {
  std::string out;
  for (const auto& l : lines) { out += l; out += '\n'; }
  return out;
}

} // namespace fixtures
