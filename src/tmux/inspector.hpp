#pragma once

#include "platform/multiplexer.hpp"
#include "topology.hpp"

#include <expected>
#include <string>

// The multiplexer could not be queried or answered with something we cannot parse.
struct InspectionError {
    std::string message;
};

class Inspector {
public:
    explicit Inspector(Multiplexer& mux);

    // Current session tree. Zero sessions is a valid (empty) result.
    std::expected<SessionTree, InspectionError> inspect();

    // Parse list-panes output produced with format(). Sessions keep their order of
    // appearance; windows and panes are sorted by index.
    static std::expected<SessionTree, InspectionError> parse(const std::string& output);

    // Tab-separated tmux format string understood by parse().
    static const std::string& format();

private:
    Multiplexer& mux_;
};
