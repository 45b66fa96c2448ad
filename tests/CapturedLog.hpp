#pragma once

#include "common/Logger.hpp"
#include <iostream>
#include <sstream>
#include <string>

// Redirects the logger for one test and restores defaults afterwards
class CapturedLog {
public:
    CapturedLog() {
        gqlevo::common::Logger::instance().setOutputStream(&m_stream);
    }

    ~CapturedLog() {
        auto& logger = gqlevo::common::Logger::instance();
        logger.disableFileLogging();
        logger.setOutputStream(&std::cout);
        logger.setLevel(gqlevo::common::LogLevel::INFO);
    }

    std::string text() const { return m_stream.str(); }

private:
    std::ostringstream m_stream;
};
