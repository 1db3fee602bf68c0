// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <value_de/raw_value.h>
#include <value_de/serialization.h>
#include <value_de/value.h>

namespace value_de {

RawValue RawValue::from_string(std::string json)
{
    std::string error;
    [[maybe_unused]] const Value parsed = from_json(json, &error);
    if (!error.empty()) {
        throw Error::custom(error);
    }
    return RawValue{std::move(json)};
}

RawValue RawValue::from_value(const Value& val)
{
    return RawValue{to_json(val, true)};
}

Value RawValue::to_value() const
{
    return from_json(json_);
}

std::ostream& operator<<(std::ostream& os, const RawValue& raw)
{
    return os << raw.get();
}

} // namespace value_de
