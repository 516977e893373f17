// C API for WASM and FFI bindings.

#ifndef MAJORITY_C_H
#define MAJORITY_C_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ============================================================================
// Handle and Error Definitions
// ============================================================================

/// @brief Opaque handle to a ranking instance.
typedef void* MajorityHandle;

/// @brief Error codes returned by API functions.
typedef enum {
  MAJORITY_OK = 0,
  MAJORITY_ERROR_INVALID_PARAM = 1,
  MAJORITY_ERROR_INVALID_CONFIG = 2,
  MAJORITY_ERROR_NO_SKATERS = 3,
} MajorityError;

// ============================================================================
// Output Data Structures
// ============================================================================

/// @brief JSON output.
typedef struct {
  char* json;     ///< Null-terminated JSON string
  size_t length;  ///< String length (without terminator)
} MajorityJsonData;

/// @brief Summary of the last ranking.
typedef struct {
  uint32_t skater_count;        ///< Competitors ranked
  uint32_t skipped_line_count;  ///< Input lines without marks
  uint32_t tied_group_count;    ///< Groups resolved by the tie-break cascade
} MajorityInfo;

// ============================================================================
// Lifecycle
// ============================================================================

/// @brief Create a new ranking instance with default configuration.
/// @return Handle (must be freed with majority_destroy)
MajorityHandle majority_create(void);

/// @brief Destroy a ranking instance.
/// @param handle Handle to destroy
void majority_destroy(MajorityHandle handle);

// ============================================================================
// Configuration and Ranking
// ============================================================================

/// @brief Apply a flat JSON config on top of the current configuration.
///
/// JSON fields (all optional):
///   marks_per_part: number (1-10, default 3)
///   pretty: boolean
///
/// @param handle Ranking handle
/// @param json JSON config string
/// @param length Length of the JSON string
/// @return MAJORITY_OK on success, MAJORITY_ERROR_INVALID_CONFIG on malformed JSON
MajorityError majority_configure_json(MajorityHandle handle, const char* json, size_t length);

/// @brief Parse score text ("Name: a1 a2 a3 b1 b2 b3" per line) and rank it.
/// @param handle Ranking handle
/// @param text Score text
/// @param length Length of the text
/// @return MAJORITY_OK on success, MAJORITY_ERROR_NO_SKATERS if no line holds marks
MajorityError majority_rank_text(MajorityHandle handle, const char* text, size_t length);

// ============================================================================
// Output Retrieval
// ============================================================================

/// @brief Get ranking results as a JSON array ordered by rank.
/// @param handle Ranking handle
/// @return JSON data (must be freed with majority_free_json), NULL without a result
MajorityJsonData* majority_get_results_json(MajorityHandle handle);

/// @brief Get the reduced victory graph as JSON.
/// @param handle Ranking handle
/// @return JSON data (must be freed with majority_free_json), NULL without a result
MajorityJsonData* majority_get_graph_json(MajorityHandle handle);

/// @brief Free JSON data.
/// @param data Pointer returned by a majority_get_*_json function
void majority_free_json(MajorityJsonData* data);

/// @brief Get summary info of the last ranking.
/// @param handle Ranking handle
/// @return Pointer to static MajorityInfo (valid until next call, do not free)
MajorityInfo* majority_get_info(MajorityHandle handle);

// ============================================================================
// Tie-Break Level Enumeration
// ============================================================================

/// @brief Get number of tie-break levels. @return Count (4)
uint8_t majority_tie_break_level_count(void);

/// @brief Get tie-break level name. @param id Level ID (0-3) @return Name (e.g. "b-score-sum")
const char* majority_tie_break_level_name(uint8_t id);

// ============================================================================
// Error Handling and Utilities
// ============================================================================

/// @brief Get error message for error code.
/// @param error Error code
/// @return Error message (static, do not free)
const char* majority_error_string(MajorityError error);

/// @brief Get library version string.
/// @return Version (e.g., "0.1.0")
const char* majority_version(void);

#ifdef __cplusplus
}
#endif

#endif  // MAJORITY_C_H
