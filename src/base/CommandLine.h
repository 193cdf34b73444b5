///////////////////////////////////////////////////////////////////////////////
///
///	\file    CommandLine.h
///	\version October 19, 2026
///
///	<summary>
///		Macros for declaring and parsing "--name value" style command line
///		arguments.
///	</summary>
///	<remarks>
///		Copyright 2000-2026 Paul Ullrich
///
///		This file is distributed as part of the GridRegimes source code package.
///		Permission is granted to use, copy, modify and distribute this
///		source code and its documentation under the terms of the GNU General
///		Public License.  This software is provided "as is" without express
///		or implied warranty.
///	</remarks>

#ifndef _COMMANDLINE_H_
#define _COMMANDLINE_H_

#include "Announce.h"
#include "Exception.h"
#include "STLStringHelper.h"

#include <vector>
#include <string>
#include <cstdlib>
#include <cstring>
#include <cmath>

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line parameter.
///	</summary>
class CommandLineArgument {
public:
	CommandLineArgument(
		const std::string & strName,
		const std::string & strDescription
	) :
		m_strName(std::string("--") + strName),
		m_strDescription(strDescription)
	{ }

	///	<summary>
	///		Virtual destructor.
	///	</summary>
	virtual ~CommandLineArgument() {
	}

	///	<summary>
	///		Number of values required.
	///	</summary>
	virtual int GetValueCount() const = 0;

	///	<summary>
	///		Print the usage information of this parameter.
	///	</summary>
	virtual void PrintUsage() const = 0;

	///	<summary>
	///		Activate this parameter.
	///	</summary>
	virtual void Activate() {
	}

	///	<summary>
	///		Set the value from a string.
	///	</summary>
	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		_EXCEPTION1("Option %s takes no value", m_strName.c_str());
	}

public:
	///	<summary>
	///		Name of this parameter, including the leading "--".
	///	</summary>
	std::string m_strName;

	///	<summary>
	///		Description of this parameter.
	///	</summary>
	std::string m_strDescription;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line boolean; present means true.
///	</summary>
class CommandLineArgumentBool : public CommandLineArgument {
public:
	CommandLineArgumentBool(
		bool & ref,
		const std::string & strName,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_fValue(ref)
	{
		m_fValue = false;
	}

	virtual int GetValueCount() const {
		return (0);
	}

	virtual void PrintUsage() const {
		Announce("  %s <bool> [%s] %s",
			m_strName.c_str(),
			(m_fValue)?("true"):("false"),
			m_strDescription.c_str());
	}

	virtual void Activate() {
		m_fValue = true;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	bool & m_fValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line string.
///	</summary>
class CommandLineArgumentString : public CommandLineArgument {
public:
	CommandLineArgumentString(
		std::string & ref,
		const std::string & strName,
		const std::string & strDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_strValue(ref)
	{
		m_strValue = strDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		Announce("  %s <string> [\"%s\"] %s",
			m_strName.c_str(),
			m_strValue.c_str(),
			m_strDescription.c_str());
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		m_strValue = strValue;
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	std::string & m_strValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line integer.  Non-integer values are rejected.
///	</summary>
class CommandLineArgumentInt : public CommandLineArgument {
public:
	CommandLineArgumentInt(
		int & ref,
		const std::string & strName,
		int nDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_nValue(ref)
	{
		m_nValue = nDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		Announce("  %s <integer> [%i] %s",
			m_strName.c_str(),
			m_nValue,
			m_strDescription.c_str());
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		if (!STLStringHelper::IsInteger(strValue)) {
			_EXCEPTION2("Option %s expects an integer value (given \"%s\")",
				m_strName.c_str(), strValue.c_str());
		}
		m_nValue = atoi(strValue.c_str());
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	int & m_nValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		A command line double.  Non-numeric values are rejected.
///	</summary>
class CommandLineArgumentDouble : public CommandLineArgument {
public:
	CommandLineArgumentDouble(
		double & ref,
		const std::string & strName,
		double dDefaultValue,
		const std::string & strDescription
	) :
		CommandLineArgument(strName, strDescription),
		m_dValue(ref)
	{
		m_dValue = dDefaultValue;
	}

	virtual int GetValueCount() const {
		return (1);
	}

	virtual void PrintUsage() const {
		if (fabs(m_dValue) < 1.0e6) {
			Announce("  %s <double> [%f] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		} else {
			Announce("  %s <double> [%e] %s",
				m_strName.c_str(),
				m_dValue,
				m_strDescription.c_str());
		}
	}

	virtual void SetValue(
		int ix,
		const std::string & strValue
	) {
		if (ix != 0) {
			_EXCEPTIONT("Invalid value index.");
		}
		if (!STLStringHelper::IsFloat(strValue)) {
			_EXCEPTION2("Option %s expects a numeric value (given \"%s\")",
				m_strName.c_str(), strValue.c_str());
		}
		m_dValue = atof(strValue.c_str());
	}

public:
	///	<summary>
	///		Argument value.
	///	</summary>
	double & m_dValue;
};

///////////////////////////////////////////////////////////////////////////////

///	<summary>
///		Begin the definition of command line parameters.
///	</summary>
#define BeginCommandLine() \
	{ bool _errorCommandLine = false; \
	  bool _invalidArgument = false; \
	  std::vector<CommandLineArgument*> _vecArguments;

///	<summary>
///		Define a new command line boolean parameter.
///	</summary>
#define CommandLineBool(ref, name) \
	_vecArguments.push_back( \
		new CommandLineArgumentBool(ref, name, ""));

///	<summary>
///		Define a new command line string parameter.
///	</summary>
#define CommandLineString(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, ""));

#define CommandLineStringD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentString(ref, name, value, desc));

///	<summary>
///		Define a new command line integer parameter.
///	</summary>
#define CommandLineInt(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, ""));

#define CommandLineIntD(ref, name, value, desc) \
	_vecArguments.push_back( \
		new CommandLineArgumentInt(ref, name, value, desc));

///	<summary>
///		Define a new command line double parameter.
///	</summary>
#define CommandLineDouble(ref, name, value) \
	_vecArguments.push_back( \
		new CommandLineArgumentDouble(ref, name, value, ""));

///	<summary>
///		Parse the command line.  A value that begins with "--" is treated
///		as the next option rather than a value.
///	</summary>
#define ParseCommandLine(argc, argv) \
	for (int _command = 1; _command < argc; _command++) { \
		bool _found = false; \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			if (_vecArguments[_p]->m_strName != argv[_command]) { \
				continue; \
			} \
			_found = true; \
			_vecArguments[_p]->Activate(); \
			int _nValues = _vecArguments[_p]->GetValueCount(); \
			int _z = 0; \
			for (; _z < _nValues; _z++) { \
				if (_command + 1 >= argc) break; \
				const char * _szNext = argv[_command + 1]; \
				if ((strlen(_szNext) > 2) && \
				    (_szNext[0] == '-') && (_szNext[1] == '-') \
				) break; \
				_command++; \
				_vecArguments[_p]->SetValue(_z, _szNext); \
			} \
			if (_z != _nValues) { \
				Announce("Error: Insufficient values for option %s", \
					_vecArguments[_p]->m_strName.c_str()); \
				_errorCommandLine = true; \
				_command = argc; \
			} \
			break; \
		} \
		if ((!_found) && (_command < argc)) { \
			_invalidArgument = true; \
			Announce("ERROR: Invalid argument \"%s\"", argv[_command]); \
		} \
	}

///	<summary>
///		Print usage information and exit on a malformed command line.
///	</summary>
#define PrintCommandLineUsage(argv) \
	if ((_errorCommandLine) || (_invalidArgument)) \
		Announce("\nUsage: %s <Argument List>", argv[0]); \
	Announce("Arguments:"); \
	for (size_t _p = 0; _p < _vecArguments.size(); _p++) \
		_vecArguments[_p]->PrintUsage(); \
	if ((_errorCommandLine) || (_invalidArgument)) \
		exit(-1);

///	<summary>
///		End the definition of command line parameters.
///	</summary>
#define EndCommandLine(argv) \
		PrintCommandLineUsage(argv); \
		for (size_t _p = 0; _p < _vecArguments.size(); _p++) { \
			delete _vecArguments[_p]; \
		} \
	}

///////////////////////////////////////////////////////////////////////////////

#endif

