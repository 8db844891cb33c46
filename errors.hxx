#pragma once

#include <stdexcept>

class LineHistoryError: public std::runtime_error {
	using std::runtime_error::runtime_error;
};

class RepositoryNotFound: public LineHistoryError {
	using LineHistoryError::LineHistoryError;
};

class RepositoryEmpty: public LineHistoryError {
	using LineHistoryError::LineHistoryError;
};

class FileNotFound: public LineHistoryError {
	using LineHistoryError::LineHistoryError;
};

/**
 * @brief Date string matched none of the supported formats
 */
class InvalidDateFormat: public LineHistoryError {
	using LineHistoryError::LineHistoryError;
};

/**
 * @brief Unexpected read failure of the repository backend
 */
class BackendError: public LineHistoryError {
	using LineHistoryError::LineHistoryError;
};
