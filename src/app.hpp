#pragma once

#include <memory>
#include <string>

class App {
public:
    /// dir is searched for the installer document
    explicit App(const std::string& dir = ".");
    ~App();

    void run();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
