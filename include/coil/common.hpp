#pragma once

#include <initializer_list>
#include <span>
#include <string_view>

namespace coil {

// Helper function to create a literal span
template <typename T>
std::span<T> span(std::initializer_list<T> contiguous)
{
    return std::span((T*)contiguous.begin(), contiguous.size());
}

}
