#ifndef EDGEWFC_RESULT_HPP
#define EDGEWFC_RESULT_HPP

enum class Result
{
	kSuccess,
	kFail,
	kUnfinished,
};

const char* to_string(Result result);

#endif
