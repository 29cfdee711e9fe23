#pragma once

#include "palmtree/core/MatrixTraits.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace palmtree {

/**
 * @brief Row-major rectangular matrix owning its storage.
 *
 * Instances are normally created through core::MemoryGuard::allocate(), which
 * checks free RAM before the storage is committed. The matrix is move-only so
 * a decoded buffer is never duplicated on its way to the caller.
 */
template <typename T>
class DenseMatrix {
public:
    DenseMatrix(uint64_t rows, uint64_t cols, T fill_value = T{})
        : rows_(rows), cols_(cols), storage_(rows * cols, fill_value) {}

    DenseMatrix(const DenseMatrix&) = delete;
    DenseMatrix& operator=(const DenseMatrix&) = delete;
    DenseMatrix(DenseMatrix&&) noexcept = default;
    DenseMatrix& operator=(DenseMatrix&&) noexcept = default;

    uint64_t rows() const { return rows_; }
    uint64_t cols() const { return cols_; }

    // NumPy-aligned: size is total elements.
    uint64_t size() const { return rows_ * cols_; }
    uint64_t size_in_bytes() const { return size() * sizeof(T); }

    DataType get_data_type() const { return MatrixTraits<T>::data_type; }

    void set(uint64_t i, uint64_t j, T value) {
        if (i >= rows_ || j >= cols_) throw std::out_of_range("Index out of bounds");
        storage_[i * cols_ + j] = value;
    }

    T get(uint64_t i, uint64_t j) const {
        if (i >= rows_ || j >= cols_) throw std::out_of_range("Index out of bounds");
        return storage_[i * cols_ + j];
    }

    void fill(T value) {
        for (auto& v : storage_) v = value;
    }

    // Writes `value` into column `j` of rows [row_begin, row_end).
    void fill_column(uint64_t j, uint64_t row_begin, uint64_t row_end, T value) {
        if (j >= cols_ || row_begin > row_end || row_end > rows_) {
            throw std::out_of_range("Column range out of bounds");
        }
        for (uint64_t i = row_begin; i < row_end; ++i) {
            storage_[i * cols_ + j] = value;
        }
    }

    T* row(uint64_t i) {
        if (i >= rows_) throw std::out_of_range("Row index out of bounds");
        return storage_.data() + i * cols_;
    }

    const T* row(uint64_t i) const {
        if (i >= rows_) throw std::out_of_range("Row index out of bounds");
        return storage_.data() + i * cols_;
    }

    T* data() { return storage_.data(); }
    const T* data() const { return storage_.data(); }

private:
    uint64_t rows_ = 0;
    uint64_t cols_ = 0;
    std::vector<T> storage_;
};

// The decoded run matrix: one row per sample, doubles throughout.
using SampleMatrix = DenseMatrix<double>;

} // namespace palmtree
