#pragma once

#include "schema/schema_introspector.hpp"
#include <string>
#include <vector>

namespace seedgen::testing {

/**
 * @brief Returns a prebuilt snapshot and records the requested schema
 */
class FakeSchemaIntrospector : public ISchemaIntrospector {
public:
    explicit FakeSchemaIntrospector(SchemaSnapshot snapshot) : snapshot_(std::move(snapshot)) {}

    [[nodiscard]] SchemaSnapshot introspect(const std::string& schema) override {
        requested_.push_back(schema);
        SchemaSnapshot copy = snapshot_;
        copy.schema = schema;
        return copy;
    }

    [[nodiscard]] const std::vector<std::string>& requested() const { return requested_; }

private:
    SchemaSnapshot snapshot_;
    std::vector<std::string> requested_;
};

} // namespace seedgen::testing
