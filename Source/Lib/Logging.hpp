/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/common.h>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>

#include "StdLib.hpp"

#include <mutex>

namespace Log {
    using SpdLogger = spdlog::logger;
    using SpdSink = spdlog::sinks::sink;
    using namespace StdLib;

    class ILoggingRegistryManagement {
    public:
        virtual ~ILoggingRegistryManagement() = default;
        virtual void RegisterModule(const String &moduleName) = 0;
        virtual SharedPtr<SpdLogger> Logger(const String &moduleName) = 0;
        virtual void AddLogSink(SharedPtr<SpdSink> sink) = 0;
        virtual void SetLevel(spdlog::level::level_enum level) = 0;
    };

    class NullLoggerRegistryManagement : public ILoggingRegistryManagement {
    public:
        ~NullLoggerRegistryManagement() override = default;

        virtual void RegisterModule([[maybe_unused]] const String &) override {
        };

        virtual SharedPtr<SpdLogger> Logger([[maybe_unused]] const String &) override {
            static SharedPtr<SpdLogger> logger = std::make_shared<SpdLogger>("", std::make_shared<spdlog::sinks::null_sink_mt>());
            return logger;
        };

        virtual void AddLogSink([[maybe_unused]] SharedPtr<SpdSink>) override { }

        virtual void SetLevel([[maybe_unused]] spdlog::level::level_enum) override { }
    };

    class LoggerRegistry : public ILoggingRegistryManagement {
    public:
        virtual ~LoggerRegistry() = default;

        LoggerRegistry(spdlog::sinks_init_list sinksList) : mSinksList(std::make_shared<spdlog::sinks::dist_sink_mt>()) {
            mSinksList->set_sinks(std::move(sinksList));
        }

        virtual void RegisterModule(const String &moduleName) override {
            std::lock_guard<std::mutex> _(mLoggersMutex);
            auto logger = std::make_shared<SpdLogger>(moduleName, mSinksList);
            logger->set_level(mLevel);
            mLoggerByModuleName[moduleName] = logger;
        }

        virtual SharedPtr<SpdLogger> Logger(const String &moduleName) override {
            std::lock_guard<std::mutex> _(mLoggersMutex);
            auto loggerIt = mLoggerByModuleName.find(moduleName);
            if (loggerIt == mLoggerByModuleName.end()) {
                // If currently the logger has not been registered yet then create new one and turn off logging possibility
                mLoggerByModuleName[moduleName] = std::make_shared<SpdLogger>(moduleName);
                loggerIt = mLoggerByModuleName.find(moduleName);
                loggerIt->second->set_level(spdlog::level::off);
            }

            return loggerIt->second;
        }

        virtual void AddLogSink(spdlog::sink_ptr sink) override {
            mSinksList->add_sink(sink);
        }

        // Applies to already registered modules and to the ones registered later
        virtual void SetLevel(spdlog::level::level_enum level) override {
            std::lock_guard<std::mutex> _(mLoggersMutex);
            mLevel = level;
            for (auto &[_, logger] : mLoggerByModuleName) {
                if (logger->sinks().empty() || (logger->sinks().front() != mSinksList)) {
                    continue;
                }

                logger->set_level(level);
            }
        }

    private:
        Map<String, SharedPtr<SpdLogger>> mLoggerByModuleName;
        SharedPtr<spdlog::sinks::dist_sink_mt> mSinksList; // We use dist_sink to add "new sink" after creating logger
        spdlog::level::level_enum mLevel = spdlog::level::err;
        std::mutex mLoggersMutex;
    };
} // namespace Log
