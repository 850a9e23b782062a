#ifndef EDGEWFC_OPTIONS_HPP
#define EDGEWFC_OPTIONS_HPP

struct Options
{
	bool export_gif = false;
};

#endif
