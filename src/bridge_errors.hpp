/*
 * bridge_errors.hpp
 *
 *  Created on:  2026-10-19
 */

#ifndef BRIDGE_ERRORS_HPP_
#define BRIDGE_ERRORS_HPP_

#include <stdexcept>
#include <string>

/**
 * Base class of all errors raised while splitting ways and tagging bridges.
 *
 * Everything except NoActiveDataset is scoped to a single bridge candidate. BridgeTagger catches
 * these errors at the candidate boundary, reports them and continues with the next candidate.
 */
class BridgeError : public std::runtime_error {
public:
    explicit BridgeError(const std::string& message) :
        std::runtime_error(message) {
    }

    /// short name of the error kind, used in log lines
    virtual const char* kind() const noexcept {
        return "BridgeError";
    }
};

/// There is no dataset to work on. This aborts the whole batch.
class NoActiveDataset : public BridgeError {
public:
    explicit NoActiveDataset(const std::string& message = "No active dataset.") :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "NoActiveDataset";
    }
};

class WayNotFound : public BridgeError {
public:
    explicit WayNotFound(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "WayNotFound";
    }
};

/// The projector could not find any segment of a way to project onto.
class NoSegmentFound : public BridgeError {
public:
    explicit NoSegmentFound(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "NoSegmentFound";
    }
};

/**
 * The projected point coincides with a node of the way. Inserting a node there would create a
 * segment of length zero.
 */
class SegmentTooShort : public NoSegmentFound {
public:
    explicit SegmentTooShort(const std::string& message) :
        NoSegmentFound(message) {
    }

    const char* kind() const noexcept override {
        return "SegmentTooShort";
    }
};

class NoPathFound : public BridgeError {
public:
    explicit NoPathFound(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "NoPathFound";
    }
};

/// Two ways which should meet at a common end node do not share one.
class PivotNotFound : public BridgeError {
public:
    explicit PivotNotFound(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "PivotNotFound";
    }
};

class AmbiguousBridgeWay : public BridgeError {
public:
    explicit AmbiguousBridgeWay(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "AmbiguousBridgeWay";
    }
};

/// A command was appended to the CommandLog before the commands it depends on.
class CommandOrderError : public BridgeError {
public:
    explicit CommandOrderError(const std::string& message) :
        BridgeError(message) {
    }

    const char* kind() const noexcept override {
        return "CommandOrderError";
    }
};

#endif /* BRIDGE_ERRORS_HPP_ */
