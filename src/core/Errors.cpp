#include "fixpoint/core/Errors.h"

namespace fixpoint {

char EngineError::ID = 0;

std::optional<ErrorKind> consumeErrorKind(llvm::Error err) {
    std::optional<ErrorKind> kind;
    llvm::handleAllErrors(
        std::move(err),
        [&](const EngineError &e) {
            if (!kind)
                kind = e.kind();
        },
        [](const llvm::ErrorInfoBase &) {});
    return kind;
}

} // namespace fixpoint
