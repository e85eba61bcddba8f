#pragma once

#include "core/Error.hpp"
#include "form/FieldFactory.hpp"
#include "form/FieldKeys.hpp"
#include "form/FieldKind.hpp"
#include "form/FieldNode.hpp"
#include "form/FormContext.hpp"
#include "form/KidList.hpp"
#include "form/NodeClassifier.hpp"
#include "form/TreeResolver.hpp"
#include "form/Widget.hpp"
#include "inspector/FieldTreeSnapshot.hpp"
#include "log/TaggedLogger.hpp"
#include "path/FieldNameIterator.hpp"
#include "store/AttributeNode.hpp"
#include "store/MemoryDocument.hpp"
