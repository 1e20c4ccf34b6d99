module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

export module Geometry:Properties;

export namespace Geometry
{
    using PropertyId = std::size_t;
    using PropertyIndex = std::uint32_t;

    constexpr PropertyIndex kInvalidIndex = std::numeric_limits<PropertyIndex>::max();

    namespace Internal
    {
        // One distinct address per element type; used to check column types at lookup.
        template <class T>
        inline constexpr char kColumnTag = 0;

        using ColumnType = const void*;

        class ColumnBase
        {
        public:
            ColumnBase() = default;
            virtual ~ColumnBase() = default;

            ColumnBase(const ColumnBase&) = delete;
            ColumnBase& operator=(const ColumnBase&) = delete;

            [[nodiscard]] virtual std::unique_ptr<ColumnBase> Clone() const = 0;
            virtual void Resize(std::size_t n) = 0;

            [[nodiscard]] virtual const std::string& Name() const noexcept = 0;
            [[nodiscard]] virtual ColumnType Type() const noexcept = 0;
        };

        template <class T>
        class Column final : public ColumnBase
        {
        public:
            Column(std::string name, T fill) : m_Name(std::move(name)), m_Fill(std::move(fill)) {}

            [[nodiscard]] std::unique_ptr<ColumnBase> Clone() const override
            {
                auto copy = std::make_unique<Column<T>>(m_Name, m_Fill);
                copy->m_Values = m_Values;
                return copy;
            }

            void Resize(std::size_t n) override { m_Values.resize(n, m_Fill); }

            [[nodiscard]] const std::string& Name() const noexcept override { return m_Name; }
            [[nodiscard]] ColumnType Type() const noexcept override { return &kColumnTag<T>; }

            [[nodiscard]] std::vector<T>& Values() noexcept { return m_Values; }

        private:
            std::string m_Name;
            T m_Fill;
            std::vector<T> m_Values;
        };
    } // namespace Internal

    // Non-owning typed view of one column. Copies refer to the same column;
    // a default-constructed view is invalid.
    template <class T>
    class Property
    {
    public:
        Property() = default;
        explicit Property(Internal::Column<T>* column) : m_Column(column) {}

        [[nodiscard]] bool IsValid() const noexcept { return m_Column != nullptr; }
        explicit operator bool() const noexcept { return IsValid(); }

        [[nodiscard]] decltype(auto) operator[](std::size_t index)
        {
            assert(m_Column != nullptr && index < m_Column->Values().size());
            return m_Column->Values()[index];
        }

        [[nodiscard]] decltype(auto) operator[](std::size_t index) const
        {
            assert(m_Column != nullptr && index < m_Column->Values().size());
            return std::as_const(m_Column->Values())[index];
        }

        [[nodiscard]] std::vector<T>& Vector() { return m_Column->Values(); }
        [[nodiscard]] const std::vector<T>& Vector() const { return m_Column->Values(); }

    private:
        Internal::Column<T>* m_Column{nullptr};
    };

    // Property indexed by a typed handle instead of a raw row number.
    template <class HandleT, class T>
    class HandleProperty : public Property<T>
    {
    public:
        HandleProperty() = default;
        explicit HandleProperty(Property<T> base) : Property<T>(std::move(base)) {}

        [[nodiscard]] decltype(auto) operator[](HandleT handle) { return Property<T>::operator[](handle.Index); }
        [[nodiscard]] decltype(auto) operator[](HandleT handle) const { return Property<T>::operator[](handle.Index); }
    };

    // A table of named columns that always share the same row count. Copying
    // the registry deep-copies every column; views obtained from the source
    // keep referring to the source.
    class PropertyRegistry
    {
    public:
        PropertyRegistry() = default;
        ~PropertyRegistry() = default;

        PropertyRegistry(const PropertyRegistry& other);
        PropertyRegistry(PropertyRegistry&&) noexcept = default;
        PropertyRegistry& operator=(const PropertyRegistry& other);
        PropertyRegistry& operator=(PropertyRegistry&&) noexcept = default;

        [[nodiscard]] std::size_t Size() const noexcept { return m_Rows; }
        [[nodiscard]] std::size_t PropertyCount() const noexcept { return m_Columns.size(); }

        // Drops every column.
        void Clear() noexcept
        {
            m_Columns.clear();
            m_Rows = 0;
        }

        void Resize(std::size_t rows);

        [[nodiscard]] std::optional<PropertyId> Find(std::string_view name) const;

        // Invalid view if the name is taken.
        template <class T>
        [[nodiscard]] Property<T> Add(std::string name, T fill = T());

        // Invalid view if the name is unknown or holds another type.
        template <class T>
        [[nodiscard]] Property<T> Get(std::string_view name) const;

        template <class T>
        [[nodiscard]] Property<T> GetOrAdd(std::string name, T fill = T());

    private:
        std::vector<std::unique_ptr<Internal::ColumnBase>> m_Columns;
        std::size_t m_Rows{0};
    };

    template <class T>
    Property<T> PropertyRegistry::Add(std::string name, T fill)
    {
        if (Find(name)) return Property<T>();

        auto column = std::make_unique<Internal::Column<T>>(std::move(name), std::move(fill));
        column->Resize(m_Rows);
        Property<T> view(column.get());
        m_Columns.push_back(std::move(column));
        return view;
    }

    template <class T>
    Property<T> PropertyRegistry::Get(std::string_view name) const
    {
        const auto id = Find(name);
        if (!id || m_Columns[*id]->Type() != &Internal::kColumnTag<T>) return Property<T>();
        return Property<T>(static_cast<Internal::Column<T>*>(m_Columns[*id].get()));
    }

    template <class T>
    Property<T> PropertyRegistry::GetOrAdd(std::string name, T fill)
    {
        if (auto existing = Get<T>(name)) return existing;
        return Add<T>(std::move(name), std::move(fill));
    }

    using PropertySet = PropertyRegistry;

    // -------------------------------------------------------------------------
    // Handles
    // -------------------------------------------------------------------------

    template <typename Tag>
    struct Handle
    {
        PropertyIndex Index = kInvalidIndex;
        auto operator<=>(const Handle&) const = default;
        [[nodiscard]] bool IsValid() const { return Index != kInvalidIndex; }
    };

    struct VertexTag {};
    struct HalfedgeTag {};
    struct EdgeTag {};
    struct LoopTag {};  // a face or the boundary

    using VertexHandle = Handle<VertexTag>;
    using HalfedgeHandle = Handle<HalfedgeTag>;
    using EdgeHandle = Handle<EdgeTag>;
    using LoopHandle = Handle<LoopTag>;

    template <class T>
    using VertexProperty = HandleProperty<VertexHandle, T>;

    template <class T>
    using HalfedgeProperty = HandleProperty<HalfedgeHandle, T>;

    template <class T>
    using EdgeProperty = HandleProperty<EdgeHandle, T>;

    template <class T>
    using LoopProperty = HandleProperty<LoopHandle, T>;
} // namespace Geometry
