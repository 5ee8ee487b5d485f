#pragma once

#include <soa-core/assert.hh>
#include <soa-core/fwd.hh>
#include <soa-core/impl/field_lifetime_util.hh>
#include <soa-core/raw_storage.hh>
#include <soa-core/row_view.hh>
#include <soa-core/slice_view.hh>
#include <soa-core/span.hh>

#include <initializer_list>
#include <limits>
#include <type_traits>
#include <utility>


/// Dynamically allocated struct-of-arrays vector of Record with value semantics.
/// Similar to std::vector<Record>, but every field lives in its own contiguous column.
/// All columns share one heap block owned through soa::raw_storage<Record>.
///
/// Element access yields row views (soa::row_view) instead of Record&: a row is spread over
/// the columns. Whole columns are available as soa::span via get<I>() / get<&Record::member>().
///
/// Growth is amortized doubling, starting at 4, capped by the largest representable layout.
/// Any growth or shrink invalidates row views, slices, column spans and iterators.
///
/// Zero-field records never allocate: the vector only counts and reports an unbounded capacity.
///
/// Usage:
///   soa::vector<particle> particles;
///   particles.push_back({1.f, 2.f, 7});
///   for (float& x : particles.get<&particle::x>())
///       x += 1.f;
template <class Record>
struct soa::vector
{
    using record_t = Record;
    using storage_t = raw_storage<Record>;

    static constexpr isize field_count = storage_t::field_count;

    template <isize I>
    using field_t = field_type_of<Record, I>;

    /// First capacity allocated by a growing vector.
    static constexpr isize min_growth_capacity = 4;

    // element access
public:
    /// Returns a view of the row at index i.
    /// Precondition: 0 <= i < size().
    [[nodiscard]] row_view<Record> operator[](isize i) { return row(i); }
    [[nodiscard]] row_view<Record const> operator[](isize i) const { return row(i); }

    [[nodiscard]] row_view<Record> row(isize i)
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _storage.row_mut(i);
    }
    [[nodiscard]] row_view<Record const> row(isize i) const
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _storage.row(i);
    }

    /// Returns a view of the first row.
    /// Precondition: !empty().
    [[nodiscard]] row_view<Record> front()
    {
        SOA_ASSERT(_size > 0, "vector is empty");
        return _storage.row_mut(0);
    }
    [[nodiscard]] row_view<Record const> front() const
    {
        SOA_ASSERT(_size > 0, "vector is empty");
        return _storage.row(0);
    }

    /// Returns a view of the last row.
    /// Precondition: !empty().
    [[nodiscard]] row_view<Record> back()
    {
        SOA_ASSERT(_size > 0, "vector is empty");
        return _storage.row_mut(_size - 1);
    }
    [[nodiscard]] row_view<Record const> back() const
    {
        SOA_ASSERT(_size > 0, "vector is empty");
        return _storage.row(_size - 1);
    }

    /// Column of field I over all rows.
    template <isize I>
    [[nodiscard]] span<field_t<I>> get()
    {
        return span<field_t<I>>(_storage.template data<I>(), _size);
    }
    template <isize I>
    [[nodiscard]] span<field_t<I> const> get() const
    {
        return span<field_t<I> const>(_storage.template data<I>(), _size);
    }

    /// Column selected by member pointer, e.g. v.get<&particle::x>().
    template <auto Member>
        requires field_member_pointer<Member>
    [[nodiscard]] auto get()
    {
        constexpr isize index = field_index_of<Record, Member>;
        static_assert(index >= 0, "member is not a field of this record");
        return get<index>();
    }
    template <auto Member>
        requires field_member_pointer<Member>
    [[nodiscard]] auto get() const
    {
        constexpr isize index = field_index_of<Record, Member>;
        static_assert(index >= 0, "member is not a field of this record");
        return get<index>();
    }

    /// All columns over [0, size()).
    [[nodiscard]] slice_view<Record> slices() { return _storage.slice_mut(0, _size); }
    [[nodiscard]] slice_view<Record const> slices() const { return _storage.slice(0, _size); }

    /// All columns over [start, end).
    /// Precondition: 0 <= start <= end <= size().
    [[nodiscard]] slice_view<Record> slices(isize start, isize end)
    {
        SOA_ASSERT(0 <= start && start <= end && end <= _size, "slice range out of bounds");
        return _storage.slice_mut(start, end);
    }
    [[nodiscard]] slice_view<Record const> slices(isize start, isize end) const
    {
        SOA_ASSERT(0 <= start && start <= end && end <= _size, "slice range out of bounds");
        return _storage.slice(start, end);
    }

    // iterators
public:
    [[nodiscard]] row_iterator<Record> begin() { return slices().begin(); }
    [[nodiscard]] row_iterator<Record> end() { return slices().end(); }
    [[nodiscard]] row_iterator<Record const> begin() const { return slices().begin(); }
    [[nodiscard]] row_iterator<Record const> end() const { return slices().end(); }

    // queries
public:
    [[nodiscard]] isize size() const { return _size; }
    [[nodiscard]] bool empty() const { return _size == 0; }

    /// Number of rows that fit without reallocation.
    [[nodiscard]] isize capacity() const { return _storage.capacity(); }

    /// Largest capacity the layout of Record can be planned for.
    [[nodiscard]] static isize max_capacity() { return storage_t::max_capacity(); }

    [[nodiscard]] memory_resource const* resource() const { return _storage.resource(); }

    /// Underlying storage, e.g. for inspecting the block or column offsets.
    [[nodiscard]] storage_t const& storage() const { return _storage; }

    // factories
public:
    /// Creates an empty vector with room for at least `capacity` rows.
    [[nodiscard]] static vector create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        vector v(resource);
        v.reserve(capacity);
        return v;
    }

    /// Creates a deep copy of the rows of a slice.
    [[nodiscard]] static vector create_copy_of(slice_view<Record const> source, memory_resource const* resource = nullptr)
    {
        vector v(resource);
        v.append_copies_of(source);
        return v;
    }

    /// Creates a vector from an array of records (array-of-structs to struct-of-arrays).
    [[nodiscard]] static vector create_copy_of(span<Record const> source, memory_resource const* resource = nullptr)
    {
        vector v(resource);
        v.reserve(source.size());
        for (auto const& r : source)
            v.push_back(r);
        return v;
    }

    // capacity management
public:
    /// Ensures room for at least `capacity` rows without changing the size.
    /// Fatal if the layout overflows or the allocation fails.
    void reserve(isize capacity)
    {
        auto const error = try_reserve(capacity);
        SOA_ASSERT_ALWAYS(error != storage_error::overflow, "layout overflow: requested capacity too large for the record fields");
        SOA_ASSERT_ALWAYS(error != storage_error::allocation_failure, "allocation failed: memory resource refused the block");
    }

    /// Like reserve, but reports failure instead of terminating. The vector is unchanged on failure.
    [[nodiscard]] storage_error try_reserve(isize capacity)
    {
        SOA_ASSERT(capacity >= 0, "capacity must be non-negative");

        auto const old_capacity = this->capacity();
        if (capacity <= old_capacity)
            return storage_error::none;

        if (capacity > max_capacity())
            return storage_error::overflow;

        if (old_capacity == 0)
            return _storage.try_allocate(capacity);
        return _storage.try_grow(old_capacity, capacity, _size);
    }

    /// Reduces the capacity to the size. An empty vector releases its block.
    void shrink_to_fit()
    {
        auto const old_capacity = capacity();
        if (old_capacity == _size || !_storage.is_allocated())
            return;

        if (_size == 0)
            _storage.deallocate(old_capacity);
        else
            _storage.shrink(old_capacity, _size, _size);
    }

    // modifiers - growth operations
public:
    /// Appends a record to the back, growing the storage if needed.
    /// Returns a view of the new row.
    row_view<Record> push_back(Record record)
    {
        ensure_capacity_for(1);
        _storage.write(_size, soa::move(record));
        ++_size;
        return _storage.row_mut(_size - 1);
    }

    /// Appends a row constructed from one value per field.
    /// Arguments may refer to rows of this vector: if the storage must grow, the record is
    /// materialized before any column moves.
    template <class... Args>
    row_view<Record> emplace_back(Args&&... fields)
    {
        static_assert(sizeof...(Args) == size_t(field_count), "one argument per field required");

        if (_size == capacity()) [[unlikely]]
            return push_back(soa::make_record<Record>(soa::forward<Args>(fields)...));

        _storage.emplace(_size, soa::forward<Args>(fields)...);
        ++_size;
        return _storage.row_mut(_size - 1);
    }

    /// Inserts a record before index i, shifting [i, size()) back by one.
    /// Precondition: 0 <= i <= size().
    /// O(n) complexity.
    row_view<Record> insert_at(isize i, Record record)
    {
        SOA_ASSERT(0 <= i && i <= _size, "insert index out of bounds");
        ensure_capacity_for(1);
        _storage.copy_within(i, i + 1, _size - i);
        _storage.write(i, soa::move(record));
        ++_size;
        return _storage.row_mut(i);
    }

    /// Resizes to `new_size` rows, value-initializing new rows and destroying surplus rows.
    void resize(isize new_size)
        requires std::is_default_constructible_v<Record>
    {
        SOA_ASSERT(new_size >= 0, "size must be non-negative");

        if (new_size <= _size)
        {
            _storage.destroy(new_size, _size);
            _size = new_size;
            return;
        }

        reserve(new_size);
        while (_size < new_size)
        {
            _storage.write(_size, Record{});
            ++_size;
        }
    }

    // modifiers - removals
public:
    /// Destroys all rows, size becomes 0. The capacity is kept.
    void clear()
    {
        _storage.destroy(0, _size);
        _size = 0;
    }

    /// Removes and returns the last row.
    /// Precondition: !empty().
    /// NOTE: Prefer remove_back() if you don't need the return value.
    [[nodiscard("use remove_back() if you don't need the return value")]] Record pop_back()
    {
        SOA_ASSERT(_size > 0, "cannot pop from empty vector");
        --_size;
        return _storage.read(_size);
    }

    /// Removes the last row.
    /// Precondition: !empty().
    void remove_back()
    {
        SOA_ASSERT(_size > 0, "cannot remove from empty vector");
        --_size;
        _storage.destroy(_size, _size + 1);
    }

    /// Removes and returns the row at index i, preserving the order of the remaining rows.
    /// Precondition: 0 <= i < size().
    /// O(n) complexity.
    [[nodiscard("use remove_at() if you don't need the return value")]] Record pop_at(isize i)
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        auto record = _storage.read(i);
        _storage.copy_within(i + 1, i, _size - i - 1);
        --_size;
        return record;
    }

    /// Removes the row at index i, preserving the order of the remaining rows.
    /// Precondition: 0 <= i < size().
    /// O(n) complexity.
    void remove_at(isize i)
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        _storage.destroy(i, i + 1);
        _storage.copy_within(i + 1, i, _size - i - 1);
        --_size;
    }

    /// Removes and returns the row at index i by moving the last row into its place.
    /// Does not preserve the order of rows.
    /// Precondition: 0 <= i < size().
    /// O(1) complexity.
    [[nodiscard("use remove_at_unordered() if you don't need the return value")]] Record pop_at_unordered(isize i)
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        auto record = _storage.read(i);
        --_size;
        if (i != _size)
            _storage.copy_within(_size, i, 1);
        return record;
    }

    /// Removes the row at index i by moving the last row into its place.
    /// Does not preserve the order of rows.
    /// Precondition: 0 <= i < size().
    /// O(1) complexity.
    void remove_at_unordered(isize i)
    {
        SOA_ASSERT(0 <= i && i < _size, "index out of bounds");
        _storage.destroy(i, i + 1);
        --_size;
        if (i != _size)
            _storage.copy_within(_size, i, 1);
    }

    // comparison
public:
    /// Equal if both have the same size and all rows compare equal.
    friend bool operator==(vector const& a, vector const& b)
    {
        if (a._size != b._size)
            return false;
        for (isize i = 0; i < a._size; ++i)
            if (!(a.row(i) == b.row(i)))
                return false;
        return true;
    }

    // construction
public:
    vector() = default;

    /// Empty vector allocating from `resource` (nullptr means the default resource).
    explicit vector(memory_resource const* resource) : _storage(resource) {}

    vector(std::initializer_list<Record> records)
    {
        reserve(isize(records.size()));
        for (auto const& r : records)
            push_back(r);
    }

    /// Deep copy, allocated from the same resource.
    vector(vector const& rhs) : _storage(rhs._storage.custom_resource()) { append_copies_of(rhs.slices()); }

    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            clear();
            append_copies_of(rhs.slices());
        }
        return *this;
    }

    vector(vector&& rhs) noexcept : _storage(soa::move(rhs._storage)), _size(soa::exchange(rhs._size, 0)) {}

    vector& operator=(vector&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _storage.destroy(0, _size);
            _storage = soa::move(rhs._storage);
            _size = soa::exchange(rhs._size, 0);
        }
        return *this;
    }

    ~vector() { _storage.destroy(0, _size); }

    // helpers
private:
    /// Grows the storage so that `count` more rows fit.
    /// Doubles the capacity (starting at min_growth_capacity) but never exceeds max_capacity().
    void ensure_capacity_for(isize count)
    {
        auto const old_capacity = capacity();
        if (count <= old_capacity - _size) [[likely]]
            return;

        auto const max = max_capacity();
        SOA_ASSERT_ALWAYS(count <= max - _size, "layout overflow: vector cannot grow beyond its maximum capacity");
        auto const required = _size + count;

        auto new_capacity = old_capacity == 0 ? min_growth_capacity : (old_capacity > max / 2 ? max : old_capacity * 2);
        new_capacity = soa::max(new_capacity, required);
        new_capacity = soa::min(new_capacity, max);

        if (old_capacity == 0)
            _storage.allocate(new_capacity);
        else
            _storage.grow(old_capacity, new_capacity, _size);
    }

    /// Appends copies of all rows of `source`, column by column.
    /// `source` must not view this vector.
    void append_copies_of(slice_view<Record const> source)
    {
        ensure_capacity_for(source.size());
        append_columns(source, std::make_index_sequence<size_t(field_count)>());
        _size += source.size();
    }

    template <size_t... I>
    void append_columns(slice_view<Record const> const& source, std::index_sequence<I...>)
    {
        (append_column<isize(I)>(source.template get<isize(I)>()), ...);
    }

    template <isize I>
    void append_column(span<field_t<I> const> column)
    {
        auto dest_end = _storage.template data<I>() + _size;
        impl::copy_create_objects_to(dest_end, column.data(), column.data() + column.size());
    }

    // members
private:
    storage_t _storage;
    isize _size = 0;
};
