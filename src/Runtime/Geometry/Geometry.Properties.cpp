module;

#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

module Geometry:Properties.Impl;

import :Properties;

namespace Geometry
{
    PropertyRegistry::PropertyRegistry(const PropertyRegistry& other) : m_Rows(other.m_Rows)
    {
        m_Columns.reserve(other.m_Columns.size());
        for (const auto& column : other.m_Columns) m_Columns.push_back(column->Clone());
    }

    PropertyRegistry& PropertyRegistry::operator=(const PropertyRegistry& other)
    {
        if (this != &other) *this = PropertyRegistry(other);
        return *this;
    }

    void PropertyRegistry::Resize(std::size_t rows)
    {
        m_Rows = rows;
        for (auto& column : m_Columns) column->Resize(rows);
    }

    std::optional<PropertyId> PropertyRegistry::Find(std::string_view name) const
    {
        for (PropertyId id = 0; id < m_Columns.size(); ++id)
        {
            if (m_Columns[id]->Name() == name) return id;
        }
        return std::nullopt;
    }
}
