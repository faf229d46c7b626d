#pragma once

#define EPISTEME_VERSION "0.9.0"
#define EPISTEME_SCHEMA_VERSION 1

namespace episteme {
namespace version {

// Records written by older builds lack a kind/schema tag; readers accept
// them as degraded. Newer schemas are rejected.
inline bool schema_readable(int schema) {
    return schema >= 0 && schema <= EPISTEME_SCHEMA_VERSION;
}

} // namespace version
} // namespace episteme
