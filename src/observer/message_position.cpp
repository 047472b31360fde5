// Copyright (c) 2025 The ISDS Developers
// Distributed under the MIT software license

#include "observer/message_position.hpp"
#include "sim/world.hpp"

namespace isds {
namespace observer {

static MessagePosition Locate(sim::Entity message, const sim::UnderlayMessage &envelope,
                              const sim::UnderlayLine &line, const sim::TimeSpan &span,
                              sim::SimSeconds now) {
  return MessagePosition{message, envelope.source, envelope.dest,
                         sim::Interpolate(line, span, now), span.ProgressClamped(now)};
}

std::optional<MessagePosition> LocateMessage(const sim::World &world, sim::Entity message,
                                             sim::SimSeconds now) {
  const auto *envelope = world.Get<sim::UnderlayMessage>(message);
  const auto *line = world.Get<sim::UnderlayLine>(message);
  const auto *span = world.Get<sim::TimeSpan>(message);
  if (!envelope || !line || !span) {
    return std::nullopt;
  }
  return Locate(message, *envelope, *line, *span, now);
}

std::vector<MessagePosition> LocateMessages(const sim::World &world, sim::SimSeconds now) {
  std::vector<MessagePosition> out;
  for (const auto &[message, envelope, line, span] :
       world.Query<sim::UnderlayMessage, sim::UnderlayLine, sim::TimeSpan>()) {
    out.push_back(Locate(message, *envelope, *line, *span, now));
  }
  return out;
}

} // namespace observer
} // namespace isds
