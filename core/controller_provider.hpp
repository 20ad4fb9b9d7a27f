#pragma once

namespace junction
{
class ControllerRegistry;

struct ControllerProvider
{
	virtual ~ControllerProvider() = default;

	// throws RegistryError on name conflict
	virtual void install(ControllerRegistry& registry) = 0;
};

struct BuiltinControllers : ControllerProvider
{
	void install(ControllerRegistry& registry) override;
};
}
