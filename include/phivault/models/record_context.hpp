#pragma once

#include <string>

namespace phivault::keystore::models {

/// Identity a ciphertext is bound to through its associated data.
/// A blob sealed for one (owner, record) pair does not open under another.
/// Both fields empty means "unbound".
struct RecordContext {
    std::string owner_id;
    std::string record_id;
};

} // namespace phivault::keystore::models
