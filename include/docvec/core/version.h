#pragma once

namespace docvec::core {

// kBuildVersion is the current software version string.
// Updated once per release slice.
constexpr const char* kBuildVersion = "0.3";

// kDocumentIdScheme tags the framing hashed into document identifiers.
// Changing the framing requires a new tag so old identifiers stay reproducible.
constexpr const char* kDocumentIdScheme = "docvec.document.v1";

// kCatalogSchemaVersion is the version of the _docvec_* catalog tables.
constexpr int kCatalogSchemaVersion = 1;

}  // namespace docvec::core
