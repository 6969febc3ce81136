//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <Taskman/Config/CoreConfig.hpp>
#include <Taskman/Exception/ConfigurationException.hpp>
#include <Taskman/Logging/LogSetup.hpp>
#include <Taskman/Server/ServerHost.hpp>
#include <boost/version.hpp>
#include <spdlog/spdlog.h>
#include <exception>

int main()
{
  // stdout belongs to the protocol, so diagnostics go to stderr even before the configuration is known
  Taskman::ConfigureLogging(Taskman::LoggingConfig{});

  try
  {
    const auto config = Taskman::LoadCoreConfigFromEnvironment();
    Taskman::ConfigureLogging(config.Logging);
    spdlog::debug("Using Boost version: {}.{}.{}", BOOST_VERSION / 100000, BOOST_VERSION / 100 % 1000, BOOST_VERSION % 100);

    Taskman::ServerHost host(config);
    return host.Run();
  }
  catch (const Taskman::ConfigurationException& ex)
  {
    spdlog::critical("Configuration error: {}", ex.what());
    return 2;
  }
  catch (const std::exception& ex)
  {
    spdlog::critical("Fatal error: {}", ex.what());
    return 1;
  }
}
