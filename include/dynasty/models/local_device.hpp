#pragma once
#include <string>

namespace dynasty::e2ee::models {

struct LocalDevice {
    std::string user_id;
    std::string device_id;
    std::string device_name;
};

}
