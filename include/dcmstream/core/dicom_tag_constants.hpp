/**
 * @file dicom_tag_constants.hpp
 * @brief Compile-time constants for tags the element stream treats specially
 *
 * @see DICOM PS3.6 - Data Dictionary
 * @see DICOM PS3.5 Section 7.5 - Nesting of Data Sets
 */

#pragma once

#include "dicom_tag.hpp"

namespace dcmstream::core::tags {

// ============================================================================
// Structural tags (Group 0xFFFE)
// ============================================================================

/// Item
inline constexpr dicom_tag item{0xFFFE, 0xE000};

/// Item Delimitation Item
inline constexpr dicom_tag item_delimitation_item{0xFFFE, 0xE00D};

/// Sequence Delimitation Item
inline constexpr dicom_tag sequence_delimitation_item{0xFFFE, 0xE0DD};

// ============================================================================
// Attributes with decoding side effects
// ============================================================================

/// Specific Character Set
inline constexpr dicom_tag specific_character_set{0x0008, 0x0005};

/// Pixel Data
inline constexpr dicom_tag pixel_data{0x7FE0, 0x0010};

// ============================================================================
// Frequently inspected attributes
// ============================================================================

/// SOP Class UID
inline constexpr dicom_tag sop_class_uid{0x0008, 0x0016};

/// SOP Instance UID
inline constexpr dicom_tag sop_instance_uid{0x0008, 0x0018};

/// Modality
inline constexpr dicom_tag modality{0x0008, 0x0060};

/// Referenced Image Sequence
inline constexpr dicom_tag referenced_image_sequence{0x0008, 0x1140};

/// Referenced SOP Class UID
inline constexpr dicom_tag referenced_sop_class_uid{0x0008, 0x1150};

/// Referenced SOP Instance UID
inline constexpr dicom_tag referenced_sop_instance_uid{0x0008, 0x1155};

/// Patient's Name
inline constexpr dicom_tag patient_name{0x0010, 0x0010};

/// Patient ID
inline constexpr dicom_tag patient_id{0x0010, 0x0020};

/// Study Instance UID
inline constexpr dicom_tag study_instance_uid{0x0020, 0x000D};

/// Rows
inline constexpr dicom_tag rows{0x0028, 0x0010};

/// Columns
inline constexpr dicom_tag columns{0x0028, 0x0011};

}  // namespace dcmstream::core::tags
