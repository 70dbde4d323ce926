#include "summary.hpp"

#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>

#include <redlog.hpp>

#include "slpgame/labels.hpp"
#include "slpquery/model_view.hpp"

#include "replay_input.hpp"

namespace slptool::commands {

namespace {

constexpr double k_frames_per_second = 60.0;

std::string format_duration(size_t frames) {
  const auto total_seconds = static_cast<uint64_t>(static_cast<double>(frames) / k_frames_per_second);
  std::stringstream ss;
  ss << total_seconds / 60 << ":" << std::setw(2) << std::setfill('0') << total_seconds % 60;
  return ss.str();
}

} // namespace

int summary(args::Positional<std::string>& replay_flag) {
  auto log = redlog::get_logger("slpkit.summary");

  if (!replay_flag) {
    log.err("replay path required");
    return 1;
  }

  auto replay = load_input(args::get(replay_flag), log);
  if (!replay) {
    return 1;
  }

  const auto& labels = slp::game::builtin_labels();
  const auto& start = replay->start;
  const auto& metadata = replay->metadata;

  std::cout << "Slippi replay " << replay->version().to_string() << (replay->partial ? " (partial)" : "") << "\n";
  std::cout << "├─ Stage: " << slp::game::annotate(labels, slp::game::label_category::stage, start.stage) << "\n";
  if (metadata.start_at) {
    std::cout << "├─ Started: " << *metadata.start_at << "\n";
  }
  if (metadata.played_on) {
    std::cout << "├─ Played on: " << *metadata.played_on << "\n";
  }
  std::cout << "├─ Duration: " << format_duration(metadata.frame_count) << " (" << metadata.frame_count
            << " frames)\n";
  if (replay->end) {
    std::cout << "├─ End: "
              << slp::game::annotate(labels, slp::game::label_category::end_method, replay->end->method) << "\n";
  }

  std::cout << "├─ Players\n";
  for (const auto& player : start.players) {
    std::cout << "│  ├─ " << slp::query::port_name(player.port) << ": "
              << slp::game::annotate(labels, slp::game::label_category::character_external, player.character) << " ("
              << slp::game::annotate(labels, slp::game::label_category::player_type, player.type) << ")";
    for (const auto& entry : metadata.players) {
      if (entry.port != player.port) {
        continue;
      }
      if (entry.netplay_name) {
        std::cout << " " << *entry.netplay_name;
      }
      if (entry.connect_code) {
        std::cout << " [" << *entry.connect_code << "]";
      }
    }
    std::cout << "\n";
  }

  std::map<std::string, size_t> diagnostic_counts;
  for (const auto& diagnostic : replay->diagnostics) {
    diagnostic_counts[std::string(slp::format::diagnostic_kind_name(diagnostic.kind))]++;
  }
  std::cout << "└─ Diagnostics: " << replay->diagnostics.size() << "\n";
  for (const auto& [kind, count] : diagnostic_counts) {
    std::cout << "   ├─ " << kind << ": " << count << "\n";
  }
  return 0;
}

} // namespace slptool::commands
