#pragma once

#include <string>

#include "common/sequenced_item.h"

namespace Chronicle {

// Canonical 36-character text form.
std::string SequenceIdToString(const SequenceId& id);

// Throws std::invalid_argument on malformed text.
SequenceId ParseSequenceId(const std::string& text);

// Name-based (version 5) id. Every process derives the same id for the same
// (ns, name) pair.
SequenceId DeriveSequenceId(const SequenceId& ns, const std::string& name);

SequenceId RandomSequenceId();

} // namespace Chronicle
