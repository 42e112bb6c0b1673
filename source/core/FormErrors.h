#pragma once

// ============================================================================
// FormErrors - Error categories for document operations
// ============================================================================

/**
 * @brief Category of a failed document operation.
 *
 * Carried in the result structs (DocumentOpenResult, FieldImportResult,
 * FieldWriteResult) so the shell can decide how to surface it.
 */
enum class FormErrorKind {
    None,       ///< No error
    Load,       ///< Source missing or unparsable; nothing is open
    Import,     ///< Existing fields unreadable; editing continues without them
    Render,     ///< A page could not be rasterised
    Write       ///< Export failed; no output produced
};
