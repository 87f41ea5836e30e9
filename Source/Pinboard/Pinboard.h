#pragma once

#include "Pinboard/Adapter/ListCanvasAdapter.h"
#include "Pinboard/Core/CanvasObjectList.h"
#include "Pinboard/Editor/Canvas/ListCanvas.h"
#include "Pinboard/Editor/Panels/CanvasSettingsPanel.h"
#include "Pinboard/Public/CanvasObject.h"
#include "Pinboard/Public/ListCanvasEditor.h"
#include "Pinboard/Public/Types.h"
#include "Pinboard/Serialization/CanvasJson.h"
#include "Pinboard/Theme/ItemTheme.h"
