#pragma once

#include <mcn_ls/compiler/compiler.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace mcn_ls::testing {

// Thrown by MockCompiler to simulate an engine fault that is not a
// std::exception.
struct NonStandardFault {
    int code = 0;
};

// ---------------------------------------------------------------------------
// MockCompiler: hand-written mock implementing ICompiler.
//
// Default behaviour: every source compiles to an empty program. Configure a
// canned outcome with SetResponse(), or make every call throw with
// ThrowStdException() / ThrowNonStandard(). Sources passed to Compile() are
// recorded for verification in tests.
// ---------------------------------------------------------------------------
class MockCompiler : public ICompiler {
public:
    enum class Fault {
        None,
        StdException,
        NonStandard,
    };

    [[nodiscard]] CompileOutcome Compile(std::string_view source) const override {
        calls_.emplace_back(source);
        switch (fault_) {
            case Fault::StdException:
                throw std::runtime_error(fault_message_);
            case Fault::NonStandard:
                throw NonStandardFault{42};
            case Fault::None:
                break;
        }
        if (response_) {
            return *response_;
        }
        return CompileOutcome::Ok(std::string());
    }

    // -- Configuration -------------------------------------------------------

    void SetResponse(CompileOutcome response) { response_ = std::move(response); }

    void SetErrors(std::vector<CompileError> errors) {
        response_ = CompileOutcome::Err(std::move(errors));
    }

    void ThrowStdException(std::string message) {
        fault_ = Fault::StdException;
        fault_message_ = std::move(message);
    }

    void ThrowNonStandard() { fault_ = Fault::NonStandard; }

    // -- Call history --------------------------------------------------------

    [[nodiscard]] const std::vector<std::string>& Calls() const noexcept { return calls_; }
    [[nodiscard]] size_t CallCount() const noexcept { return calls_.size(); }

private:
    std::optional<CompileOutcome> response_;
    Fault fault_ = Fault::None;
    std::string fault_message_;
    mutable std::vector<std::string> calls_;
};

} // namespace mcn_ls::testing
