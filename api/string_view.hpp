#pragma once
#include <string_view>

namespace junction
{
using std::string_view;
using namespace std::string_view_literals;
}
