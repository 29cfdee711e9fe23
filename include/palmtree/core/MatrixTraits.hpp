#pragma once

#include "palmtree/core/Types.hpp"
#include <cstdint>

template <typename T>
struct MatrixTraits;

template <>
struct MatrixTraits<double> {
    static constexpr palmtree::DataType data_type = palmtree::DataType::FLOAT64;
    static constexpr const char* name = "float64";
};

template <>
struct MatrixTraits<int32_t> {
    static constexpr palmtree::DataType data_type = palmtree::DataType::INT32;
    static constexpr const char* name = "int32";
};
