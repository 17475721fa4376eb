// include/core/Errors.hpp
#ifndef ID3_CORE_ERRORS_HPP
#define ID3_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace id3 {

/** 输入非法：空表、空行集、不存在的特征/取值 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/** 标签列名与已有列冲突，合并会覆盖特征 */
class AmbiguousLabelError : public std::invalid_argument {
public:
    explicit AmbiguousLabelError(const std::string& msg)
        : std::invalid_argument(msg) {}
};

/** 对零行表求概率（上游调用违反约定） */
class DegenerateProbabilityError : public std::logic_error {
public:
    explicit DegenerateProbabilityError(const std::string& msg)
        : std::logic_error(msg) {}
};

} // namespace id3

#endif // ID3_CORE_ERRORS_HPP
