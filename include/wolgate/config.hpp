#ifndef WOLGATE_CONFIG_HPP
#define WOLGATE_CONFIG_HPP

#include <string>

struct Config {
    std::string devices{"/etc/wol_devices.csv"};
    std::string broadcast{"255.255.255.255"};
    std::string iface;
    int port{9};
    int timeout_ms{1000};
    int repeat{1};
    int repeat_interval_ms{100};
};

#endif
