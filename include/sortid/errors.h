#pragma once

#include <string>
#include <stdexcept>

namespace sortid {

/**
 * sortid 예외 기본 클래스
 */
class SortIdException : public std::runtime_error {
public:
    explicit SortIdException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * 설정 검증 실패 예외 (생성자에서만 발생)
 */
class ConfigurationException : public SortIdException {
public:
    explicit ConfigurationException(const std::string& message)
        : SortIdException("Invalid configuration: " + message) {}
};

/**
 * 현재 시각이 타임스탬프 필드로 표현 가능한 범위를 벗어난 경우 예외
 */
class TimestampExhaustedException : public SortIdException {
public:
    explicit TimestampExhaustedException(const std::string& message)
        : SortIdException("Timestamp exhausted: " + message) {}
};

/**
 * 같은 시간 버킷 안에서 chrono + suffix 공간을 모두 소진한 경우 예외
 */
class RateExceededException : public SortIdException {
public:
    explicit RateExceededException(const std::string& message)
        : SortIdException("Rate exceeded: " + message) {}
};

/**
 * 잘못된 ID 문자열 디코딩 예외
 */
class DecodeException : public SortIdException {
public:
    explicit DecodeException(const std::string& message)
        : SortIdException("Decode failed: " + message) {}
};

/**
 * GeneratorInfo JSON 역직렬화 실패 예외
 */
class SerializationException : public SortIdException {
public:
    explicit SerializationException(const std::string& message)
        : SortIdException("Serialization failed: " + message) {}
};

/**
 * 보안 난수 소스 실패 예외
 */
class RandomSourceException : public SortIdException {
public:
    explicit RandomSourceException(const std::string& message)
        : SortIdException("Random source failed: " + message) {}
};

} // namespace sortid
