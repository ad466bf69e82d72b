#pragma once

#ifdef __cplusplus

#include "db.hpp"

namespace pointers {

/// Register identifier helpers on the connection:
///   ulid()           fresh identifier, 16-byte BLOB
///   ulid_text(blob)  26-character text form
///   ulid_blob(text)  stored form of a text identifier
/// Invalid input makes the calling statement fail. Idempotent.
void register_ulid_functions(database& db);

} // namespace pointers

#endif // __cplusplus
