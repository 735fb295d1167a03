#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "strategy_selector.hpp"

class SettingsManager;

inline const nlohmann::json CLIENT_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","server_url"},          {"aliases", {"server","url"}},        {"type","string"}, {"default","http://127.0.0.1:8000"}, {"description","Base URL of the sync server"}, {"persistent", true}},
  {{"key","content_dir"},         {"aliases", {"mods_dir","dir"}},      {"type","string"}, {"default","./mods"},  {"description","Local directory kept in sync"}, {"persistent", true}},
  {{"key","strategy"},            {"aliases", {"s"}},                   {"type","string"}, {"default","auto"},    {"description","auto|stable|gaming|balanced|fast"}, {"persistent", true}},
  {{"key","critical_files"},      {"aliases", {"critical"}},            {"type","list"},   {"default",nlohmann::json::array()}, {"description","Comma-separated files fetched first by the gaming strategy"}, {"persistent", true}},
  {{"key","request_timeout_ms"},  {"aliases", {"timeout"}},             {"type","int"},    {"default",30000},     {"min",100},  {"max",600000}, {"description","Per-operation network timeout"}, {"persistent", true}},
  {{"key","max_retries"},         {"aliases", {"retries"}},             {"type","int"},    {"default",5},         {"min",1},    {"max",100},    {"description","Attempts per file before it is marked failed"}, {"persistent", true}},
  {{"key","max_workers"},         {"aliases", {"workers","w"}},         {"type","int"},    {"default",8},         {"min",1},    {"max",64},     {"description","Upper bound on parallel transfers"}, {"persistent", true}},
  {{"key","chunk_size"},          {"aliases", {"chunk"}},               {"type","int"},    {"default",0},         {"min",0},    {"max",67108864}, {"description","Write/progress granularity in bytes (0 = strategy default)"}, {"persistent", true}},
  {{"key","resume_enabled"},      {"aliases", {"resume"}},              {"type","bool"},   {"default",true},      {"description","Continue interrupted downloads from partial data"}, {"persistent", true}},
  {{"key","backoff_base_ms"},     {"aliases", {"backoff"}},             {"type","int"},    {"default",1000},      {"min",0},    {"max",600000}, {"description","First retry delay, doubled per attempt"}, {"persistent", true}},
  {{"key","backoff_max_ms"},      {"aliases", {"backoff_max"}},         {"type","int"},    {"default",30000},     {"min",0},    {"max",3600000}, {"description","Retry delay ceiling"}, {"persistent", true}},
  {{"key","max_mismatch_cycles"}, {"aliases", {"mismatch_cycles"}},     {"type","int"},    {"default",2},         {"min",1},    {"max",20},     {"description","Hash mismatches before a file is quarantined"}, {"persistent", true}},
  {{"key","probe_retries"},       {"aliases", {"pr"}},                  {"type","int"},    {"default",3},         {"min",1},    {"max",20},     {"description","Attempts per connection probe request"}, {"persistent", true}},
  {{"key","probe_bytes"},         {"aliases", {"pb"}},                  {"type","int"},    {"default",0},         {"min",0},    {"max",104857600}, {"description","Speed test payload size (0 = server default)"}, {"persistent", true}},
  {{"key","delete_extraneous"},   {"aliases", {"delete","prune"}},      {"type","bool"},   {"default",false},     {"description","Remove local files the server no longer lists"}, {"persistent", true}},
  {{"key","dry_run"},             {"aliases", {"n"}},                   {"type","bool"},   {"default",false},     {"description","Plan the sync without downloading"}, {"persistent", false}},
  {{"key","verbose"},             {"aliases", {"v"}},                   {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"log"}},                 {"type","string"}, {"default",""},        {"description","Also write logs to this rotating file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},             {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json CLIENT_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index",0},{"key","server_url"}},
  {{"index",1},{"key","content_dir"}}
});

inline const nlohmann::json SERVER_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_port"},         {"aliases", {"port","p"}},            {"type","int"},    {"default",8000},      {"min",0},    {"max",65535},  {"description","TCP port to listen on"}, {"persistent", true}},
  {{"key","listen_ip"},           {"aliases", {"ip","bind"}},           {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","served_dir"},          {"aliases", {"mods_dir","dir"}},      {"type","string"}, {"default","./mods"},  {"description","Directory published to clients"}, {"persistent", true}},
  {{"key","monitoring"},          {"aliases", {"watch","m"}},           {"type","bool"},   {"default",true},      {"description","Rebuild the manifest when files change"}, {"persistent", true}},
  {{"key","debounce_ms"},         {"aliases", {"debounce"}},            {"type","int"},    {"default",500},       {"min",0},    {"max",600000}, {"description","Quiet period before a rebuild"}, {"persistent", true}},
  {{"key","rescan_interval_ms"},  {"aliases", {"rescan"}},              {"type","int"},    {"default",30000},     {"min",100},  {"max",86400000}, {"description","Polling interval when inotify is unavailable"}, {"persistent", true}},
  {{"key","scan_interval_ms"},    {"aliases", {"scan_interval"}},       {"type","int"},    {"default",300000},    {"min",0},    {"max",86400000}, {"description","Safety rescan period (0 = off)"}, {"persistent", true}},
  {{"key","speedtest_bytes"},     {"aliases", {"speedtest"}},           {"type","int"},    {"default",1048576},   {"min",1},    {"max",104857600}, {"description","Default /speedtest payload size"}, {"persistent", true}},
  {{"key","io_threads"},          {"aliases", {"threads"}},             {"type","int"},    {"default",4},         {"min",1},    {"max",64},     {"description","Threads serving HTTP requests"}, {"persistent", true}},
  {{"key","verbose"},             {"aliases", {"v"}},                   {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","log_file"},            {"aliases", {"log"}},                 {"type","string"}, {"default",""},        {"description","Also write logs to this rotating file"}, {"persistent", true}},
  {{"key","help"},                {"aliases", {"h","?"}},               {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                {"aliases", {"persist"}},             {"type","bool"},   {"default",false},     {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json SERVER_ARGV_SPECIFICATION = nlohmann::json::array({
  {{"index",0},{"key","served_dir"}},
  {{"index",1},{"key","listen_port"}}
});

struct ClientConfig {
  std::string server_url = "http://127.0.0.1:8000";
  std::filesystem::path content_dir = "./mods";
  std::chrono::milliseconds request_timeout{30000};
  std::size_t max_retries = 5;
  std::size_t max_workers = 8;
  std::size_t chunk_size = 0;
  bool resume_enabled = true;
  std::chrono::milliseconds backoff_base{1000};
  std::chrono::milliseconds backoff_max{30000};
  std::size_t max_mismatch_cycles = 2;
  StrategyKind strategy = StrategyKind::AdaptiveAuto;
  std::vector<std::string> critical_files;
  std::size_t probe_retries = 3;
  uint64_t probe_bytes = 0;
  bool delete_extraneous = false;
  bool dry_run = false;
  bool verbose = false;
  std::filesystem::path log_file;
};

struct ServerConfig {
  std::string listen_ip = "0.0.0.0";
  uint16_t listen_port = 8000;
  std::filesystem::path served_dir = "./mods";
  bool monitoring = true;
  std::chrono::milliseconds debounce{500};
  std::chrono::milliseconds rescan_interval{30000};
  std::chrono::milliseconds scan_interval{300000};
  uint64_t speedtest_bytes = 1024 * 1024;
  std::size_t io_threads = 4;
  bool verbose = false;
  std::filesystem::path log_file;
};

// Both throw std::invalid_argument when a value cannot be used.
ClientConfig client_config_from(const SettingsManager& settings);
ServerConfig server_config_from(const SettingsManager& settings);

LogOptions log_options_for(bool verbose, const std::filesystem::path& log_file);
