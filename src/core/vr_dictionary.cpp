/**
 * @file vr_dictionary.cpp
 * @brief Built-in VR entries for implicit VR decoding
 */

#include "dcmstream/core/vr_dictionary.hpp"

#include <array>
#include <mutex>

namespace dcmstream::core {

namespace {

using VR = encoding::vr_type;

struct vr_entry {
    dicom_tag tag;
    VR vr;
};

// clang-format off
constexpr std::array kStandardEntries = {
    // SOP Common and General Study/Series (0x0008)
    vr_entry{dicom_tag{0x0008, 0x0005}, VR::CS},   // Specific Character Set
    vr_entry{dicom_tag{0x0008, 0x0008}, VR::CS},   // Image Type
    vr_entry{dicom_tag{0x0008, 0x0012}, VR::DA},   // Instance Creation Date
    vr_entry{dicom_tag{0x0008, 0x0013}, VR::TM},   // Instance Creation Time
    vr_entry{dicom_tag{0x0008, 0x0016}, VR::UI},   // SOP Class UID
    vr_entry{dicom_tag{0x0008, 0x0018}, VR::UI},   // SOP Instance UID
    vr_entry{dicom_tag{0x0008, 0x0020}, VR::DA},   // Study Date
    vr_entry{dicom_tag{0x0008, 0x0021}, VR::DA},   // Series Date
    vr_entry{dicom_tag{0x0008, 0x0022}, VR::DA},   // Acquisition Date
    vr_entry{dicom_tag{0x0008, 0x0023}, VR::DA},   // Content Date
    vr_entry{dicom_tag{0x0008, 0x0030}, VR::TM},   // Study Time
    vr_entry{dicom_tag{0x0008, 0x0031}, VR::TM},   // Series Time
    vr_entry{dicom_tag{0x0008, 0x0033}, VR::TM},   // Content Time
    vr_entry{dicom_tag{0x0008, 0x0050}, VR::SH},   // Accession Number
    vr_entry{dicom_tag{0x0008, 0x0060}, VR::CS},   // Modality
    vr_entry{dicom_tag{0x0008, 0x0070}, VR::LO},   // Manufacturer
    vr_entry{dicom_tag{0x0008, 0x0080}, VR::LO},   // Institution Name
    vr_entry{dicom_tag{0x0008, 0x0090}, VR::PN},   // Referring Physician's Name
    vr_entry{dicom_tag{0x0008, 0x1030}, VR::LO},   // Study Description
    vr_entry{dicom_tag{0x0008, 0x103E}, VR::LO},   // Series Description
    vr_entry{dicom_tag{0x0008, 0x1090}, VR::LO},   // Manufacturer's Model Name
    vr_entry{dicom_tag{0x0008, 0x1110}, VR::SQ},   // Referenced Study Sequence
    vr_entry{dicom_tag{0x0008, 0x1111}, VR::SQ},   // Referenced Performed Procedure Step Sequence
    vr_entry{dicom_tag{0x0008, 0x1115}, VR::SQ},   // Referenced Series Sequence
    vr_entry{dicom_tag{0x0008, 0x1140}, VR::SQ},   // Referenced Image Sequence
    vr_entry{dicom_tag{0x0008, 0x1150}, VR::UI},   // Referenced SOP Class UID
    vr_entry{dicom_tag{0x0008, 0x1155}, VR::UI},   // Referenced SOP Instance UID
    vr_entry{dicom_tag{0x0008, 0x1160}, VR::IS},   // Referenced Frame Number
    vr_entry{dicom_tag{0x0008, 0x9215}, VR::SQ},   // Derivation Code Sequence
    vr_entry{dicom_tag{0x0008, 0x0100}, VR::SH},   // Code Value
    vr_entry{dicom_tag{0x0008, 0x0102}, VR::SH},   // Coding Scheme Designator
    vr_entry{dicom_tag{0x0008, 0x0104}, VR::LO},   // Code Meaning

    // Patient (0x0010)
    vr_entry{dicom_tag{0x0010, 0x0010}, VR::PN},   // Patient's Name
    vr_entry{dicom_tag{0x0010, 0x0020}, VR::LO},   // Patient ID
    vr_entry{dicom_tag{0x0010, 0x0030}, VR::DA},   // Patient's Birth Date
    vr_entry{dicom_tag{0x0010, 0x0040}, VR::CS},   // Patient's Sex
    vr_entry{dicom_tag{0x0010, 0x1010}, VR::AS},   // Patient's Age
    vr_entry{dicom_tag{0x0010, 0x1020}, VR::DS},   // Patient's Size
    vr_entry{dicom_tag{0x0010, 0x1030}, VR::DS},   // Patient's Weight
    vr_entry{dicom_tag{0x0010, 0x4000}, VR::LT},   // Patient Comments

    // Acquisition (0x0018)
    vr_entry{dicom_tag{0x0018, 0x0015}, VR::CS},   // Body Part Examined
    vr_entry{dicom_tag{0x0018, 0x0050}, VR::DS},   // Slice Thickness
    vr_entry{dicom_tag{0x0018, 0x0060}, VR::DS},   // KVP
    vr_entry{dicom_tag{0x0018, 0x1020}, VR::LO},   // Software Versions
    vr_entry{dicom_tag{0x0018, 0x5100}, VR::CS},   // Patient Position

    // Relationship (0x0020)
    vr_entry{dicom_tag{0x0020, 0x000D}, VR::UI},   // Study Instance UID
    vr_entry{dicom_tag{0x0020, 0x000E}, VR::UI},   // Series Instance UID
    vr_entry{dicom_tag{0x0020, 0x0010}, VR::SH},   // Study ID
    vr_entry{dicom_tag{0x0020, 0x0011}, VR::IS},   // Series Number
    vr_entry{dicom_tag{0x0020, 0x0013}, VR::IS},   // Instance Number
    vr_entry{dicom_tag{0x0020, 0x0020}, VR::CS},   // Patient Orientation
    vr_entry{dicom_tag{0x0020, 0x0032}, VR::DS},   // Image Position (Patient)
    vr_entry{dicom_tag{0x0020, 0x0037}, VR::DS},   // Image Orientation (Patient)
    vr_entry{dicom_tag{0x0020, 0x0052}, VR::UI},   // Frame of Reference UID
    vr_entry{dicom_tag{0x0020, 0x1041}, VR::DS},   // Slice Location

    // Image Pixel (0x0028)
    vr_entry{dicom_tag{0x0028, 0x0002}, VR::US},   // Samples per Pixel
    vr_entry{dicom_tag{0x0028, 0x0004}, VR::CS},   // Photometric Interpretation
    vr_entry{dicom_tag{0x0028, 0x0006}, VR::US},   // Planar Configuration
    vr_entry{dicom_tag{0x0028, 0x0008}, VR::IS},   // Number of Frames
    vr_entry{dicom_tag{0x0028, 0x0009}, VR::AT},   // Frame Increment Pointer
    vr_entry{dicom_tag{0x0028, 0x0010}, VR::US},   // Rows
    vr_entry{dicom_tag{0x0028, 0x0011}, VR::US},   // Columns
    vr_entry{dicom_tag{0x0028, 0x0030}, VR::DS},   // Pixel Spacing
    vr_entry{dicom_tag{0x0028, 0x0100}, VR::US},   // Bits Allocated
    vr_entry{dicom_tag{0x0028, 0x0101}, VR::US},   // Bits Stored
    vr_entry{dicom_tag{0x0028, 0x0102}, VR::US},   // High Bit
    vr_entry{dicom_tag{0x0028, 0x0103}, VR::US},   // Pixel Representation
    vr_entry{dicom_tag{0x0028, 0x1050}, VR::DS},   // Window Center
    vr_entry{dicom_tag{0x0028, 0x1051}, VR::DS},   // Window Width
    vr_entry{dicom_tag{0x0028, 0x1052}, VR::DS},   // Rescale Intercept
    vr_entry{dicom_tag{0x0028, 0x1053}, VR::DS},   // Rescale Slope

    // Pixel Data (0x7FE0)
    vr_entry{dicom_tag{0x7FE0, 0x0010}, VR::OW},   // Pixel Data
};
// clang-format on

}  // namespace

auto vr_dictionary::instance() -> vr_dictionary& {
    static vr_dictionary instance;
    return instance;
}

vr_dictionary::vr_dictionary() {
    entries_.reserve(kStandardEntries.size());
    for (const auto& entry : kStandardEntries) {
        entries_.emplace(entry.tag, entry.vr);
    }
}

auto vr_dictionary::find(dicom_tag tag) const -> std::optional<encoding::vr_type> {
    std::shared_lock lock(mutex_);
    const auto it = entries_.find(tag);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto vr_dictionary::lookup_vr(dicom_tag tag) const -> encoding::vr_type {
    if (const auto vr = find(tag)) {
        return *vr;
    }
    if (tag.is_structural()) {
        return VR::UN;
    }
    if (tag.is_group_length()) {
        return VR::UL;
    }
    if (tag.is_private_creator()) {
        return VR::LO;
    }
    return VR::UN;
}

auto vr_dictionary::register_tag(dicom_tag tag, encoding::vr_type vr) -> bool {
    std::unique_lock lock(mutex_);
    return entries_.insert_or_assign(tag, vr).second;
}

auto vr_dictionary::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    return entries_.size();
}

}  // namespace dcmstream::core
