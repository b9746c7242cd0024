#pragma once

#include <layerfx/error.hpp>
#include <layerfx/result.hpp>

#include <layerfx/uniforms.hpp>
#include <layerfx/description.hpp>
#include <layerfx/shader_source.hpp>
#include <layerfx/shader_compiler.hpp>
#include <layerfx/layer.hpp>
#include <layerfx/frame_plan.hpp>
#include <layerfx/pointer.hpp>

#include <layerfx/app.hpp>
#include <layerfx/window.hpp>
#include <layerfx/instance.hpp>
#include <layerfx/surface.hpp>
#include <layerfx/device.hpp>
#include <layerfx/swapchain.hpp>
#include <layerfx/frames.hpp>
#include <layerfx/allocator.hpp>
#include <layerfx/image.hpp>
#include <layerfx/buffer.hpp>
#include <layerfx/sampler.hpp>
#include <layerfx/barriers.hpp>
#include <layerfx/push_descriptor_writer.hpp>
#include <layerfx/texture.hpp>
#include <layerfx/texture_loader.hpp>
#include <layerfx/program.hpp>
#include <layerfx/render_targets.hpp>
#include <layerfx/compositor.hpp>
#include <layerfx/frame_driver.hpp>
