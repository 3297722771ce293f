/** @copyright Copyright (C) 2025 Pawel Maslanka (pawmas@hotmail.com)
 *  @license The GNU General Public License v3.0
 */
#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/common.h>

#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/null_sink.h>

#include "StdLib.hpp"

namespace Log {
    using SpdLogger = spdlog::logger;
    using SpdSink = spdlog::sinks::sink;
    using Level = spdlog::level::level_enum;
    using namespace StdLib;

    class ILoggingRegistryManagement {
    public:
        virtual ~ILoggingRegistryManagement() = default;
        virtual void RegisterModule(const String &moduleName) = 0;
        virtual SharedPtr<SpdLogger> Logger(const String &moduleName) = 0;
        virtual void AddLogSink(SharedPtr<SpdSink> sink) = 0;
        virtual void SetLevel(Level level) = 0;
    };

    /** Hands out a single silent logger. Library code logs through it unless the host installs a real registry */
    class NullLoggerRegistryManagement : public ILoggingRegistryManagement {
    public:
        ~NullLoggerRegistryManagement() override = default;

        virtual void RegisterModule([[maybe_unused]] const String &) override {
        };

        virtual SharedPtr<SpdLogger> Logger([[maybe_unused]] const String &) override {
            static SharedPtr<SpdLogger> logger = std::make_shared<SpdLogger>("null", std::make_shared<spdlog::sinks::null_sink_mt>());
            return logger;
        };

        virtual void AddLogSink([[maybe_unused]] SharedPtr<SpdSink>) override { }

        virtual void SetLevel([[maybe_unused]] Level) override { }
    };

    class LoggerRegistry : public ILoggingRegistryManagement {
    public:
        virtual ~LoggerRegistry() = default;

        LoggerRegistry(spdlog::sinks_init_list sinksList, Level level = spdlog::level::warn)
          : mSinksList(std::make_shared<spdlog::sinks::dist_sink_mt>()), mLevel(level) {
            mSinksList->set_sinks(std::move(sinksList));
        }

        virtual void RegisterModule(const String &moduleName) override {
            LockGuard<Mutex> lock(mLock);
            auto logger = std::make_shared<SpdLogger>(moduleName, mSinksList);
            logger->set_level(mLevel);
            mLoggerByModuleName[moduleName] = logger;
        }

        virtual SharedPtr<SpdLogger> Logger(const String &moduleName) override {
            LockGuard<Mutex> lock(mLock);
            auto loggerIt = mLoggerByModuleName.find(moduleName);
            if (loggerIt == mLoggerByModuleName.end()) {
                // Not registered module gets a logger without sinks, so it stays quiet until registered
                auto logger = std::make_shared<SpdLogger>(moduleName);
                logger->set_level(spdlog::level::off);
                loggerIt = mLoggerByModuleName.emplace(moduleName, logger).first;
            }

            return loggerIt->second;
        }

        virtual void AddLogSink(spdlog::sink_ptr sink) override {
            mSinksList->add_sink(sink);
        }

        virtual void SetLevel(Level level) override {
            LockGuard<Mutex> lock(mLock);
            mLevel = level;
            for (auto &[_, logger] : mLoggerByModuleName) {
                if (logger->sinks().empty()) {
                    continue;
                }

                logger->set_level(level);
            }
        }

    private:
        Map<String, SharedPtr<SpdLogger>> mLoggerByModuleName;
        SharedPtr<spdlog::sinks::dist_sink_mt> mSinksList; // We use dist_sink to add "new sink" after creating logger
        Level mLevel;
        Mutex mLock;
    };
} // namespace Log
