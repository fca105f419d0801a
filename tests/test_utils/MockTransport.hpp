#pragma once
#include "scpi-driver/transport/Transport.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace scpidrv {
namespace test {

/// Simulated SCPI instrument.
///
/// Writes of the form "HEADER value" are remembered per header, so a later
/// "HEADER?" answers with the last written value. Query answers are looked
/// up in this order: queued responses, scripted responses, remembered state.
/// A query nothing answers times out on the following read (status -1).
/// Keys are case-insensitive.
class MockTransport : public Transport {
public:
  MockTransport();

  /// Fixed answer to an exact query
  void set_response(const std::string &command, const std::string &response);
  /// Answers consumed one per query before any scripted answer
  void push_responses(const std::string &command,
                      const std::vector<std::string> &responses);
  /// Fails every write of the command (exact match or same header)
  void set_error(const std::string &command, int status);
  void clear_error(const std::string &command);

  void set_state(const std::string &header, const std::string &value);
  std::optional<std::string> state(const std::string &header) const;

  /// Retransmit every received line before answering
  void set_echo(bool echo);

  std::vector<std::string> get_command_history() const;
  size_t command_count() const;
  /// Number of history entries equal to the command (case-insensitive)
  size_t count_of(const std::string &command) const;
  void clear_history();

  int write(const std::string &line) override;
  int read(std::string &line) override;
  size_t bytes_pending() override;

private:
  static std::string key(const std::string &text);
  static std::string header_of(const std::string &command);

  std::optional<std::string> answer(const std::string &command);

  mutable std::mutex mutex_;
  std::vector<std::string> command_history_;
  std::map<std::string, std::string> responses_;
  std::map<std::string, std::deque<std::string>> queued_;
  std::map<std::string, int> errors_;
  std::map<std::string, std::string> state_;
  std::deque<std::string> pending_;
  bool echo_{false};
};

} // namespace test
} // namespace scpidrv
