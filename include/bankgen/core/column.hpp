#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace bankgen {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// Tag type for dictionary-encoded categorical columns.
struct Categorical {};

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Generated batches are built column by column, so the interface is
/// limited to appends, indexed access and iteration.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked access.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Zero-copy immutable view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void reserve(size_type capacity) { data_.reserve(capacity); }

    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

/// Specialization for categorical columns (dictionary-encoded strings).
///
/// Used for low-cardinality generated attributes (state codes, spending
/// categories). The dictionary is shared between copies so that gathers keep
/// the same codes.
template <>
class Column<Categorical> {
   public:
    using value_type = std::string_view;
    using size_type = std::size_t;
    using code_type = std::int32_t;

    Column()
        : dict_(std::make_shared<std::vector<std::string>>()),
          index_(std::make_shared<std::unordered_map<std::string, code_type>>()) {}

    explicit Column(std::vector<std::string> dict)
        : dict_(std::make_shared<std::vector<std::string>>(std::move(dict))),
          index_(std::make_shared<std::unordered_map<std::string, code_type>>()) {
        rebuild_index();
    }

    Column(std::shared_ptr<std::vector<std::string>> dict,
           std::shared_ptr<std::unordered_map<std::string, code_type>> index,
           std::vector<code_type> codes = {})
        : dict_(std::move(dict)), index_(std::move(index)), codes_(std::move(codes)) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return codes_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return codes_.empty(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> value_type {
        return (*dict_)[static_cast<std::size_t>(codes_[idx])];
    }

    [[nodiscard]] auto code_at(size_type idx) const noexcept -> code_type { return codes_[idx]; }

    void push_code(code_type code) { codes_.push_back(code); }

    void push_back(value_type value) { codes_.push_back(find_or_insert(value)); }

    void reserve(size_type capacity) { codes_.reserve(capacity); }

    [[nodiscard]] auto dictionary() const noexcept -> const std::vector<std::string>& {
        return *dict_;
    }

    [[nodiscard]] auto dictionary_ptr() const noexcept
        -> const std::shared_ptr<std::vector<std::string>>& {
        return dict_;
    }

    [[nodiscard]] auto index_ptr() const noexcept
        -> const std::shared_ptr<std::unordered_map<std::string, code_type>>& {
        return index_;
    }

    [[nodiscard]] auto find_code(value_type value) const -> std::optional<code_type> {
        auto it = index_->find(std::string(value));
        if (it == index_->end()) {
            return std::nullopt;
        }
        return it->second;
    }

   private:
    void rebuild_index() {
        index_->clear();
        index_->reserve(dict_->size());
        for (std::size_t i = 0; i < dict_->size(); ++i) {
            index_->emplace((*dict_)[i], static_cast<code_type>(i));
        }
    }

    auto find_or_insert(value_type value) -> code_type {
        auto it = index_->find(std::string(value));
        if (it != index_->end()) {
            return it->second;
        }
        auto code = static_cast<code_type>(dict_->size());
        dict_->emplace_back(value);
        index_->emplace(dict_->back(), code);
        return code;
    }

    std::shared_ptr<std::vector<std::string>> dict_;
    std::shared_ptr<std::unordered_map<std::string, code_type>> index_;
    std::vector<code_type> codes_;
};

}  // namespace bankgen
