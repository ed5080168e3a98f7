#pragma once

#include <functional>
#include <string>

namespace voice_bridge {
namespace utils {

void run_async(std::function<void()> task, const std::string& name = "async");

}
}
