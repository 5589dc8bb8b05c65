#pragma once

#include <functional>
#include <memory>
#include <string>

namespace revtun {

// IHandlerFactory
struct IHandlerFactory {
  virtual ~IHandlerFactory() = default;
  // New handler for `subcmd`, or nullptr when no handler serves it.
  virtual std::shared_ptr<class IHandler> create(const std::string &subcmd) = 0;
};

// Minimal common contract for subcommand handlers
struct IHandler {
  virtual ~IHandler() = default;
  // The subcommand name this handler responds to (e.g., "up", "conf")
  virtual std::string command() const = 0;
  // Runs the subcommand to completion. Failures are thrown as RevtunError.
  virtual void start() = 0;
};

struct HandlerFactoryImpl : public IHandlerFactory {
  using CreatorFunc =
      std::function<std::shared_ptr<IHandler>(const std::string &subcmd)>;
  CreatorFunc creator_;

  explicit HandlerFactoryImpl(CreatorFunc creator)
      : creator_(std::move(creator)) {}

  std::shared_ptr<IHandler> create(const std::string &subcmd) override {
    return creator_(subcmd);
  }
};

} // namespace revtun
