#include "register_types.h"
#include "level_config.h"
#include "world_manager.h"
#include <flecs.h>

using namespace godot;

// The flecs log level is process-wide: the extension sets the default
// once here, and WispServer only changes it when a rules file asks to.
void initialize_wisp_module(ModuleInitializationLevel p_level) {
  if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
    return;
  }
  flecs::log::set_level(wisp::EngineConfig{}.log_level);
  ClassDB::register_class<WispServer>();
}

void uninitialize_wisp_module(ModuleInitializationLevel p_level) {
  if (p_level != MODULE_INITIALIZATION_LEVEL_SCENE) {
    return;
  }
}

extern "C" {
GDExtensionBool GDE_EXPORT
wisp_library_init(GDExtensionInterfaceGetProcAddress p_get_proc_address,
                  const GDExtensionClassLibraryPtr p_library,
                  GDExtensionInitialization *r_initialization) {
  godot::GDExtensionBinding::InitObject init_obj(p_get_proc_address, p_library,
                                                 r_initialization);

  init_obj.register_initializer(initialize_wisp_module);
  init_obj.register_terminator(uninitialize_wisp_module);
  init_obj.set_minimum_library_initialization_level(
      MODULE_INITIALIZATION_LEVEL_SCENE);

  return init_obj.init();
}
}
