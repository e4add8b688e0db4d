#include "dcmstream/encoding/transfer_syntax.hpp"

#include <algorithm>
#include <array>

namespace dcmstream::encoding {

namespace {

struct ts_entry {
    std::string_view uid;
    std::string_view name;
    byte_order endian;
    vr_encoding vr;
    bool encapsulated;
    bool deflated;
};

constexpr std::array<ts_entry, 11> TS_REGISTRY = {{
    {"1.2.840.10008.1.2", "Implicit VR Little Endian",
     byte_order::little_endian, vr_encoding::implicit, false, false},
    {"1.2.840.10008.1.2.1", "Explicit VR Little Endian",
     byte_order::little_endian, vr_encoding::explicit_vr, false, false},
    {"1.2.840.10008.1.2.2", "Explicit VR Big Endian",
     byte_order::big_endian, vr_encoding::explicit_vr, false, false},
    {"1.2.840.10008.1.2.1.99", "Deflated Explicit VR Little Endian",
     byte_order::little_endian, vr_encoding::explicit_vr, false, true},
    {"1.2.840.10008.1.2.4.50", "JPEG Baseline (Process 1)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.4.51", "JPEG Extended (Process 2 & 4)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.4.70", "JPEG Lossless, Non-Hierarchical, First-Order Prediction",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.4.80", "JPEG-LS Lossless Image Compression",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.4.90", "JPEG 2000 Image Compression (Lossless Only)",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.4.91", "JPEG 2000 Image Compression",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
    {"1.2.840.10008.1.2.5", "RLE Lossless",
     byte_order::little_endian, vr_encoding::explicit_vr, true, false},
}};

auto strip_uid_padding(std::string_view uid) -> std::string_view {
    while (!uid.empty() && (uid.back() == '\0' || uid.back() == ' ')) {
        uid.remove_suffix(1);
    }
    return uid;
}

const ts_entry* find_entry(std::string_view uid) {
    uid = strip_uid_padding(uid);
    const auto it = std::find_if(TS_REGISTRY.begin(), TS_REGISTRY.end(),
                                 [uid](const ts_entry& entry) { return entry.uid == uid; });
    return it != TS_REGISTRY.end() ? &*it : nullptr;
}

}  // namespace

const transfer_syntax transfer_syntax::implicit_vr_little_endian{"1.2.840.10008.1.2"};
const transfer_syntax transfer_syntax::explicit_vr_little_endian{"1.2.840.10008.1.2.1"};
const transfer_syntax transfer_syntax::explicit_vr_big_endian{"1.2.840.10008.1.2.2"};
const transfer_syntax transfer_syntax::deflated_explicit_vr_little_endian{"1.2.840.10008.1.2.1.99"};

transfer_syntax::transfer_syntax(std::string_view uid)
    : uid_(strip_uid_padding(uid)),
      name_("Unknown"),
      endianness_(byte_order::little_endian),
      vr_type_(vr_encoding::implicit),
      encapsulated_(false),
      deflated_(false),
      valid_(false) {
    if (const auto* entry = find_entry(uid)) {
        name_ = entry->name;
        endianness_ = entry->endian;
        vr_type_ = entry->vr;
        encapsulated_ = entry->encapsulated;
        deflated_ = entry->deflated;
        valid_ = true;
    }
}

std::string_view transfer_syntax::uid() const noexcept {
    return uid_;
}

std::string_view transfer_syntax::name() const noexcept {
    return name_;
}

byte_order transfer_syntax::endianness() const noexcept {
    return endianness_;
}

vr_encoding transfer_syntax::vr_type() const noexcept {
    return vr_type_;
}

bool transfer_syntax::is_encapsulated() const noexcept {
    return encapsulated_;
}

bool transfer_syntax::is_deflated() const noexcept {
    return deflated_;
}

bool transfer_syntax::is_valid() const noexcept {
    return valid_;
}

bool transfer_syntax::is_supported() const noexcept {
    return valid_ && !deflated_;
}

bool transfer_syntax::operator==(const transfer_syntax& other) const noexcept {
    return uid_ == other.uid_;
}

std::optional<transfer_syntax> find_transfer_syntax(std::string_view uid) {
    if (find_entry(uid) == nullptr) {
        return std::nullopt;
    }
    return transfer_syntax{uid};
}

std::vector<transfer_syntax> supported_transfer_syntaxes() {
    std::vector<transfer_syntax> result;
    result.reserve(TS_REGISTRY.size());
    for (const auto& entry : TS_REGISTRY) {
        if (!entry.deflated) {
            result.emplace_back(entry.uid);
        }
    }
    return result;
}

}  // namespace dcmstream::encoding
