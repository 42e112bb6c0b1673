#pragma once

// ============================================================================
// ToolType - Canvas interaction modes
// ============================================================================

/**
 * @brief Mutually exclusive canvas modes selected from the toolbar.
 *
 * Pointer selects, drags and resizes existing fields. The two placement
 * modes drop a new field on the next click and then fall back to Pointer.
 */
enum class ToolType {
    Pointer,    ///< Select / move / resize fields
    AddText,    ///< Place a text field on the next click
    AddCheckbox ///< Place a checkbox on the next click
};
