/**
 * @file SwiftProtocol.cpp
 * @brief Frame formatting and reply parsing
 */

#include "SwiftProtocol.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace sorting_arm {
namespace arm {
namespace serial {

namespace {

/// Value following @p key (and an optional ':') in @p text
std::optional<double> findNumber(const std::string& text, char key) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        // Key must start a token
        if (pos > 0 && text[pos - 1] != ' ') {
            ++pos;
            continue;
        }
        size_t start = pos + 1;
        if (start < text.size() && text[start] == ':') {
            ++start;
        }
        const char* begin = text.c_str() + start;
        char* end = nullptr;
        double value = std::strtod(begin, &end);
        if (end != begin && std::isfinite(value)) {
            return value;
        }
        ++pos;
    }
    return std::nullopt;
}

} // namespace

std::string formatMove(const Position& target, double feedRate) {
    char buf[96];
    snprintf(buf, sizeof(buf), "G0 X%.2f Y%.2f Z%.2f F%.0f",
             target.x, target.y, target.z, feedRate);
    return buf;
}

std::string formatServoAngle(int servo, double angleDeg) {
    char buf[48];
    snprintf(buf, sizeof(buf), "G2202 N%d V%.2f", servo, angleDeg);
    return buf;
}

std::string formatEffector(EndEffector effector, bool on) {
    std::string cmd = effector == EndEffector::Pump ? "M2231" : "M2232";
    return cmd + (on ? " V1" : " V0");
}

std::string tagCommand(unsigned seq, const std::string& command) {
    return "#" + std::to_string(seq) + " " + command;
}

double feedRateForSpeed(double speedPercent, double maxFeedRate) {
    double clamped = std::clamp(speedPercent, 1.0, 100.0);
    return maxFeedRate * clamped / 100.0;
}

std::optional<Reply> parseReply(const std::string& line) {
    if (line.size() < 2 || line[0] != '$') {
        return std::nullopt;
    }

    std::istringstream ss(line.substr(1));
    Reply reply;
    std::string status;
    if (!(ss >> reply.seq >> status)) {
        return std::nullopt;
    }

    std::string rest;
    std::getline(ss, rest);
    size_t first = rest.find_first_not_of(' ');
    reply.payload = first == std::string::npos ? "" : rest.substr(first);

    if (status == "ok" || status == "OK") {
        reply.ok = true;
    } else if (status.size() > 1 && status[0] == 'E') {
        reply.ok = false;
        reply.errorCode = std::atoi(status.c_str() + 1);
        reply.payload = status;
    } else {
        return std::nullopt;
    }
    return reply;
}

std::optional<Position> parsePosition(const std::string& payload) {
    auto x = findNumber(payload, 'X');
    auto y = findNumber(payload, 'Y');
    auto z = findNumber(payload, 'Z');
    if (!x || !y || !z) {
        return std::nullopt;
    }
    return Position(*x, *y, *z);
}

std::optional<JointAngles> parseAngles(const std::string& payload) {
    auto base = findNumber(payload, 'B');
    auto left = findNumber(payload, 'L');
    auto right = findNumber(payload, 'R');
    if (!base || !left || !right) {
        return std::nullopt;
    }
    return JointAngles(*base, *left, *right);
}

std::optional<int> parseValue(const std::string& payload) {
    auto v = findNumber(payload, 'V');
    if (!v) {
        return std::nullopt;
    }
    return static_cast<int>(std::lround(*v));
}

} // namespace serial
} // namespace arm
} // namespace sorting_arm
