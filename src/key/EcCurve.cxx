// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "EcCurve.hxx"

const EcCurve *
FindEcCurveByKeyType(std::string_view key_type) noexcept
{
	for (const auto &i : ec_curves)
		if (i.key_type == key_type)
			return &i;

	return nullptr;
}

const EcCurve *
FindEcCurveByGroupName(std::string_view group_name) noexcept
{
	for (const auto &i : ec_curves)
		if (group_name == i.group_name || group_name == i.alt_group_name)
			return &i;

	return nullptr;
}
