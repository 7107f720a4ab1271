#pragma once

#include <chrono>
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <core/constants.hpp>
#include <core/types.hpp>

namespace fs = std::filesystem;

enum class AllocationMode {
    Normal,     // interactive, classic SSH access to the nodes
    Deploy,     // nodes may be reimaged with an OS deployment
};

enum class VlanMode {
    None,
    Routed,
    Isolated,
};

// Subnet ("slash") request. An explicit bit count wins over the named widths;
// among the named widths slash_22 wins over slash_18.
struct SubnetRequest {
    std::optional<int> slash_bits;   // slash_<bits>=1
    std::optional<int> slash_22;     // count of /22 subnets
    std::optional<int> slash_18;     // count of /18 subnets

    bool empty() const { return !slash_bits && !slash_22 && !slash_18; }
};

struct ReservationRequest {
    std::optional<int> nodes;                   // explicit count, exclusive with hosts
    std::vector<std::string> hosts;             // explicit host list
    bool ignore_dead = false;                   // drop dead hosts before compiling
    std::string site;
    std::optional<std::string> cluster;
    std::chrono::seconds walltime{DEFAULT_WALLTIME_SECS};
    std::optional<std::time_t> start_at;        // earliest start, epoch seconds
    AllocationMode mode = AllocationMode::Normal;
    VlanMode vlan = VlanMode::None;
    SubnetRequest subnet;
    std::optional<int> switches;
    std::optional<std::string> command;         // default: sleep for the walltime
    std::string name = DEFAULT_JOB_NAME;
    bool async = false;
    std::optional<std::string> environment;     // deploy this image once running
    std::optional<std::string> ssh_key;         // public key path for the deployment
    std::optional<std::string> raw_resources;   // verbatim resource hierarchy
};

// Text -> enum. Unrecognized values throw ConfigurationError naming the option.
AllocationMode parse_allocation_mode(const std::string& text);
VlanMode parse_vlan_mode(const std::string& text);

const char* to_string(AllocationMode mode);
const char* to_string(VlanMode mode);

// Parse a declarative reservation from YAML text. Missing keys take their
// values from defaults; unknown keys and bad values are errors.
Result<ReservationRequest> parse_reservation_yaml(const std::string& text,
                                                  const ReservationDefaults& defaults);

// Load a reservation request file.
Result<ReservationRequest> load_reservation(const fs::path& path,
                                            const ReservationDefaults& defaults);
