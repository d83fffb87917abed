#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "defaults.h"

// Scalar form value. Serialized verbatim (string), in decimal (integer) or
// as "true"/"false" (boolean).
using field_value_t = std::variant<std::string, std::int64_t, bool>;

std::string field_value_to_string(const field_value_t& value);

// Form fields in insertion order. Names are unique: setting a name that is
// already present replaces its value and keeps its position.
class FormFields {
public:
    using entry_t = std::pair<std::string, field_value_t>;

    void put(const std::string& name, field_value_t value);

    template <typename T>
    void set(const std::string& name, T&& value) {
        using U = std::decay_t<T>;
        if constexpr (std::is_same_v<U, bool>) {
            put(name, field_value_t(std::in_place_type<bool>, value));
        } else if constexpr (std::is_integral_v<U>) {
            put(name, field_value_t(std::in_place_type<std::int64_t>, static_cast<std::int64_t>(value)));
        } else {
            put(name, field_value_t(std::in_place_type<std::string>, std::forward<T>(value)));
        }
    }

    const field_value_t* find(const std::string& name) const;
    bool contains(const std::string& name) const { return find(name) != nullptr; }

    std::size_t size() const { return fields_.size(); }
    bool empty() const { return fields_.empty(); }

    std::vector<entry_t>::const_iterator begin() const { return fields_.begin(); }
    std::vector<entry_t>::const_iterator end() const { return fields_.end(); }

private:
    std::vector<entry_t> fields_;
};

// Binary part. data holds the raw file bytes and is copied to the body verbatim.
struct attachment_t {
    std::string field;
    std::string filename;
    std::string data;
};

struct multipart_body_t {
    std::string body;
    std::string boundary;

    std::string content_type() const {
        return "multipart/form-data; boundary=" + boundary;
    }
};

// BOUNDARY_LENGTH characters from [A-Z0-9], drawn with libsodium's CSPRNG.
// Throws std::runtime_error if libsodium cannot be initialised.
std::string generate_boundary();

// Encodes fields, then attachments, each group in insertion order.
//
// The boundary must not occur inside any value, filename or attachment; this
// is not checked. Names, values and filenames are written without escaping.
multipart_body_t encode_multipart_formdata(
    const FormFields& fields,
    const std::vector<attachment_t>& attachments,
    const std::string& boundary
);

// As above with a freshly generated boundary.
multipart_body_t encode_multipart_formdata(
    const FormFields& fields,
    const std::vector<attachment_t>& attachments
);
