#pragma once
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

std::string trim(std::string s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string &line);
std::string now_string();
std::string file_stem(const std::string &path);

//#define DEBUG 
#define DEBUG_SIMULATION false
#define DEBUG_BATCH false

#ifdef DEBUG
    #warning "Debug-printing is active"
    #define DEBUG_PRINT(condition, msg, ...) \
      if (condition) \
        printf("[%s:%s():%d] " msg "\n", __FILE__, __func__, __LINE__, ##__VA_ARGS__);
#else 
    #define DEBUG_PRINT(condition, msg, ...) 
#endif
